// File: Combat.hpp
// Description: Damage rolls shared by PvE and PvP battles.
#pragma once
#include "game_session.hpp"
#include "ServerConfig.hpp"
#include "CombatRng.hpp"

struct AwakeningDefinition;

struct AttackRoll {
	int damage = 0;
	bool hit = true;
	bool critical = false;
};

/**
 * @brief Rolls a player's fast or strong attack.
 * Draw order: crit, then (strong only) hit, then variance.
 * The crit multiplier is applied after variance and the result floored once.
 */
AttackRoll roll_player_attack(BattleAction action, int power, const BattleRules& rules, CombatRng& rng);

// Scripted opponent retaliation. Draw order: crit, then variance.
AttackRoll roll_opponent_attack(int power, const BattleRules& rules, CombatRng& rng);

// What is left of an incoming hit when the target is defending.
int apply_defense(int damage, const BattleRules& rules);

int awakened_strike_damage(const AwakeningDefinition& awakening, const CombatantState& target);

// Spends one awakened turn on the signature strike and returns its damage.
// Caller has checked the attacker is awakened.
int perform_awakened_strike(CombatantState& attacker, const CombatantState& target);

// Subtracts damage, clamping health at zero.
void apply_damage(CombatantState& target, int damage);

bool can_awaken(const CombatantState& c);

// Enters the awakened state. Caller has checked can_awaken.
const AwakeningDefinition& begin_awakening(CombatantState& c, const BattleRules& rules);

/**
 * @brief Counts one enemy turn against an active awakening.
 * A turn already paid for by an awakened strike is not counted twice.
 * @return true when the awakening ran out on this call.
 */
bool advance_awakening(CombatantState& c);
