// File: PvpBattle.cpp
#include "PvpBattle.hpp"
#include "Combat.hpp"
#include "GameData.hpp"
#include <iostream>

using json = nlohmann::json;

PvpBattle::PvpBattle(net::io_context& ioc, BattleServices services, Side first, Side second)
	: BattleSession(ioc, std::move(services))
	, userIds_{ first.state.id, second.state.id }
	, sides_{ std::move(first), std::move(second) }
{
}

void PvpBattle::start()
{
	std::lock_guard<std::mutex> lock(mutex_);
	phase_ = BattlePhase::STARTING;
	std::cout << "[PVP] Match " << id() << ": " << sides_[0].state.name
		<< " vs " << sides_[1].state.name << std::endl;

	for (int side = 0; side < 2; ++side)
	{
		sendTo(sides_[side].channel, "MATCH_FOUND", json{
			{"battleId", id()},
			{"player", sides_[side].state},
			{"opponent", sides_[1 - side].state}
			});
	}

	scheduleLocked(services_.rules.matchStartDelay, [this]
		{
			turn_ = 0;
			phase_ = BattlePhase::AWAITING_PLAYER_ACTION;
			std::string line = "The battle begins! " + sides_[0].state.name + " strikes first.";
			appendLog(line);
			emitBoth(line);
		});
}

int PvpBattle::sideOf(const std::string& userId) const
{
	if (userId == userIds_[0]) return 0;
	if (userId == userIds_[1]) return 1;
	return -1;
}

bool PvpBattle::turnOpenFor(int side) const {
	return phase_ == BattlePhase::AWAITING_PLAYER_ACTION && !locked_ && !finished_ && turn_ == side;
}

void PvpBattle::emitStateTo(int side, const std::string& line, json extra)
{
	const bool myTurn = turnOpenFor(side);
	extra["battleId"] = id();
	extra["log"] = line;
	extra["player"] = sides_[side].state;
	extra["opponent"] = sides_[1 - side].state;
	extra["isPlayerTurn"] = myTurn;
	extra["canUseAbility"] = myTurn && can_awaken(sides_[side].state);
	sendTo(sides_[side].channel, "BATTLE_UPDATE", extra);
}

void PvpBattle::emitBoth(const std::string& line, json extra)
{
	emitStateTo(0, line, extra);
	emitStateTo(1, line, extra);
}

ActionResult PvpBattle::submitAction(const std::string& actorId, BattleAction action)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (finished_)
		return ActionResult::STALE;

	const int side = sideOf(actorId);
	if (side < 0)
		return ActionResult::REJECTED;
	if (!turnOpenFor(side))
	{
		emitStateTo(side, "It's not your turn!");
		return ActionResult::REJECTED;
	}

	CombatantState& actor = sides_[side].state;
	CombatantState& target = sides_[1 - side].state;

	if (action == BattleAction::USE_ABILITY && !can_awaken(actor))
	{
		emitStateTo(side, "You can't use an ability right now.");
		return ActionResult::NOT_ELIGIBLE;
	}
	if (action == BattleAction::AWAKENED_ABILITY && !actor.awakenedState.active)
	{
		emitStateTo(side, "You are not awakened.");
		return ActionResult::NOT_ELIGIBLE;
	}

	phase_ = BattlePhase::RESOLVING_PLAYER_ACTION;

	if (action == BattleAction::USE_ABILITY)
	{
		castAwakening(side);
		return ActionResult::APPLIED;
	}

	// This action is one enemy turn for the target's own awakening.
	std::string line;
	if (advance_awakening(target))
	{
		sendTo(sides_[1 - side].channel, "AWAKENING_END");
		line = target.name + "'s awakening fades. ";
	}

	actor.isDefending = false;
	int damage = 0;
	json extra = json::object();

	switch (action)
	{
	case BattleAction::FAST_ATTACK:
	case BattleAction::STRONG_ATTACK:
	{
		AttackRoll hit = roll_player_attack(action, actor.power, services_.rules, *services_.rng);
		damage = hit.damage;
		if (!hit.hit)
			line += actor.name + " missed a strong attack!";
		else
			line += actor.name + (action == BattleAction::FAST_ATTACK ? " strikes fast" : " strikes hard")
				+ (hit.critical ? " with a CRITICAL HIT" : "");
		break;
	}
	case BattleAction::DEFEND:
		actor.isDefending = true;
		line += actor.name + " raises their guard.";
		break;
	case BattleAction::AWAKENED_ABILITY:
		damage = perform_awakened_strike(actor, target);
		line += actor.name + " unleashes " + actor.awakenedState.abilityName;
		extra["abilityUsed"] = actor.awakenedState.abilityName;
		break;
	default:
		break;
	}

	if (action != BattleAction::DEFEND)
	{
		// Any attack, even a miss, uses up the target's guard.
		// Awakened strikes land in full.
		if (target.isDefending && damage > 0 && action != BattleAction::AWAKENED_ABILITY)
		{
			damage = apply_defense(damage, services_.rules);
			line += ", but " + target.name + " defends";
		}
		target.isDefending = false;
		if (damage > 0)
			line += " for " + std::to_string(damage) + " damage!";
	}

	apply_damage(target, damage);
	appendLog(line);
	extra["damage"] = damage;
	extra["actor"] = actor.id;

	turn_ = 1 - side;

	if (target.health <= 0)
	{
		emitBoth(line, extra);
		concludeLocked(side, false);
		return ActionResult::APPLIED;
	}

	phase_ = BattlePhase::AWAITING_PLAYER_ACTION;
	emitBoth(line, extra);
	return ActionResult::APPLIED;
}

void PvpBattle::castAwakening(int side)
{
	CombatantState& actor = sides_[side].state;
	const AwakeningDefinition& def = begin_awakening(actor, services_.rules);

	std::string line = actor.name + " awakens the power of " + def.character + "!";
	appendLog(line);
	std::cout << "[PVP] " << actor.name << " used " << def.abilityName << " in match " << id() << std::endl;

	sendTo(sides_[side].channel, "PLAY_AWAKENING", json{ {"character", def.character} });
	sendTo(sides_[1 - side].channel, "PLAY_OPPONENT_AWAKENING", json{
		{"character", def.character},
		{"messages", def.spectatorLines},
		{"theme", def.theme}
		});

	// The caster keeps the turn and follows up with the awakened strike.
	phase_ = BattlePhase::AWAKENING_CUTSCENE;
	scheduleLocked(services_.rules.awakeningCutsceneDelay, [this, side, character = def.character]
		{
			phase_ = BattlePhase::AWAITING_PLAYER_ACTION;
			emitStateTo(side, "The power of " + character + " flows through you!");
			emitStateTo(1 - side, sides_[side].state.name + " has awakened " + character + "!");
		});
}

void PvpBattle::concludeLocked(int winner, bool forfeit)
{
	markFinished();
	const int loser = 1 - winner;
	const CombatantState& w = sides_[winner].state;
	const CombatantState& l = sides_[loser].state;

	if (forfeit)
	{
		std::cout << "[PVP] " << l.name << " left match " << id() << "; " << w.name << " wins by forfeit" << std::endl;
		sendTo(sides_[winner].channel, "OPPONENT_DISCONNECTED");
		sendTo(sides_[winner].channel, "BATTLE_END", json{
			{"win", true},
			{"forfeit", true},
			{"message", l.name + " left the battle. You win!"}
			});
		return;
	}

	std::cout << "[PVP] " << w.name << " defeated " << l.name << " in match " << id() << std::endl;
	sendTo(sides_[loser].channel, "BATTLE_END", json{
		{"win", false},
		{"message", "DEFEAT! " + w.name + " won the duel."}
		});
	settle(sides_[winner].channel, w.id, services_.rules.pvpWinCoins, services_.rules.pvpWinXp,
		json{ {"win", true}, {"message", "VICTORY! You defeated " + l.name + "!"} });
}

void PvpBattle::handleDisconnect(const std::string& connectionId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (finished_)
		return;
	for (int side = 0; side < 2; ++side)
	{
		if (sides_[side].connectionId == connectionId)
		{
			concludeLocked(1 - side, true);
			return;
		}
	}
}

std::optional<CombatantState> PvpBattle::combatant(const std::string& combatantId) const
{
	std::lock_guard<std::mutex> lock(mutex_);
	const int side = sideOf(combatantId);
	if (side < 0) return std::nullopt;
	return sides_[side].state;
}

std::string PvpBattle::currentTurn() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return userIds_[turn_];
}
