// File: Combat.cpp
#include "Combat.hpp"
#include "GameData.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// 1.0 +/- variance, centred so a draw of 0.5 is exactly 1.0
double variance_multiplier(double variance, CombatRng& rng) {
	return 1.0 + (rng.roll() * 2.0 - 1.0) * variance;
}

} // namespace

AttackRoll roll_player_attack(BattleAction action, int power, const BattleRules& rules, CombatRng& rng) {
	AttackRoll result;
	result.critical = rng.roll() < rules.playerCritChance;
	const double crit = result.critical ? rules.critMultiplier : 1.0;

	switch (action) {
	case BattleAction::FAST_ATTACK:
		result.damage = static_cast<int>(std::floor(
			power * rules.fastAttackRatio * variance_multiplier(rules.fastAttackVariance, rng) * crit));
		break;
	case BattleAction::STRONG_ATTACK:
		result.hit = rng.roll() < rules.strongAttackHitChance;
		if (!result.hit) {
			result.critical = false;
			return result;
		}
		result.damage = static_cast<int>(std::floor(
			power * rules.strongAttackRatio * variance_multiplier(rules.strongAttackVariance, rng) * crit));
		break;
	default:
		throw std::invalid_argument("not a direct attack");
	}

	result.damage = std::max(0, result.damage);
	return result;
}

AttackRoll roll_opponent_attack(int power, const BattleRules& rules, CombatRng& rng) {
	AttackRoll result;
	result.critical = rng.roll() < rules.opponentCritChance;
	const double crit = result.critical ? rules.critMultiplier : 1.0;
	result.damage = static_cast<int>(std::floor(
		power * rules.opponentAttackRatio * variance_multiplier(rules.opponentAttackVariance, rng) * crit));
	result.damage = std::max(0, result.damage);
	return result;
}

int apply_defense(int damage, const BattleRules& rules) {
	return static_cast<int>(std::floor(damage * rules.defendDamageFactor));
}

int awakened_strike_damage(const AwakeningDefinition& awakening, const CombatantState& target) {
	return awakening.lethal ? target.health : awakening.damage;
}

int perform_awakened_strike(CombatantState& attacker, const CombatantState& target) {
	const AwakeningDefinition* def = find_awakening(attacker.awakenedState.character);
	if (!def)
		throw std::logic_error("awakened strike without an awakening");

	attacker.awakenedState.turnsLeft--;
	attacker.awakenedState.chargeSpent = true;
	return awakened_strike_damage(*def, target);
}

void apply_damage(CombatantState& target, int damage) {
	target.health = std::max(0, target.health - damage);
}

bool can_awaken(const CombatantState& c) {
	return c.activeCharacter
		&& !c.abilityUsed
		&& find_awakening(c.activeCharacter->name) != nullptr;
}

const AwakeningDefinition& begin_awakening(CombatantState& c, const BattleRules& rules) {
	const AwakeningDefinition* def = c.activeCharacter ? find_awakening(c.activeCharacter->name) : nullptr;
	if (!def)
		throw std::logic_error("begin_awakening without an eligible character");

	c.abilityUsed = true; // never reset for the rest of the battle
	c.awakenedState.active = true;
	c.awakenedState.character = def->character;
	c.awakenedState.abilityName = def->abilityName;
	c.awakenedState.turnsLeft = rules.awakeningTurns;
	c.awakenedState.chargeSpent = false;
	return *def;
}

bool advance_awakening(CombatantState& c) {
	AwakenedState& a = c.awakenedState;
	if (!a.active) return false;

	if (!a.chargeSpent)
		a.turnsLeft--;
	a.chargeSpent = false;

	if (a.turnsLeft > 0) return false;

	a.active = false;
	a.turnsLeft = 0;
	return true;
}
