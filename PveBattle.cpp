// File: PveBattle.cpp
// Description: PvE turn loop. The player acts, then after a short pause the
// scripted opponent retaliates, until one side drops to zero health.
#include "PveBattle.hpp"
#include "Combat.hpp"
#include "GameData.hpp"
#include <iostream>

using json = nlohmann::json;

PveBattle::PveBattle(net::io_context& ioc, BattleServices services,
	const std::shared_ptr<PlayerChannel>& channel,
	CombatantState player, CombatantState opponent)
	: BattleSession(ioc, std::move(services))
	, channel_(channel)
	, userId_(player.id)
	, connectionId_(channel->connectionId())
	, player_(std::move(player))
	, opponent_(std::move(opponent))
{
}

void PveBattle::start()
{
	std::lock_guard<std::mutex> lock(mutex_);
	phase_ = BattlePhase::AWAITING_PLAYER_ACTION;
	std::string line = "A wild " + opponent_.name + " appears!";
	appendLog(line);
	std::cout << "[PVE] " << player_.name << " started a battle against " << opponent_.name
		<< " (battle " << id() << ")" << std::endl;
	emitUpdate(line);
}

bool PveBattle::playerTurnOpen() const {
	return phase_ == BattlePhase::AWAITING_PLAYER_ACTION && !locked_ && !finished_;
}

void PveBattle::emitUpdate(const std::string& line, json extra)
{
	extra["battleId"] = id();
	extra["log"] = line;
	extra["player"] = player_;
	extra["opponent"] = opponent_;
	extra["isPlayerTurn"] = playerTurnOpen();
	extra["canUseAbility"] = playerTurnOpen() && can_awaken(player_);
	sendTo(channel_, "BATTLE_UPDATE", extra);
}

ActionResult PveBattle::submitAction(const std::string& actorId, BattleAction action)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (finished_)
		return ActionResult::STALE;
	if (actorId != userId_)
		return ActionResult::REJECTED;

	if (!playerTurnOpen())
	{
		emitUpdate("Wait for your turn!");
		return ActionResult::REJECTED;
	}

	if (action == BattleAction::USE_ABILITY && !can_awaken(player_))
	{
		emitUpdate("You can't use an ability right now.");
		return ActionResult::NOT_ELIGIBLE;
	}
	if (action == BattleAction::AWAKENED_ABILITY && !player_.awakenedState.active)
	{
		emitUpdate("You are not awakened.");
		return ActionResult::NOT_ELIGIBLE;
	}

	phase_ = BattlePhase::RESOLVING_PLAYER_ACTION;

	if (action == BattleAction::USE_ABILITY)
	{
		const AwakeningDefinition& def = begin_awakening(player_, services_.rules);
		std::string line = player_.name + " awakens the power of " + def.character + "!";
		appendLog(line);
		std::cout << "[PVE] " << player_.name << " used " << def.abilityName << std::endl;

		sendTo(channel_, "PLAY_AWAKENING", json{ {"character", def.character} });
		phase_ = BattlePhase::AWAKENING_CUTSCENE;
		scheduleLocked(services_.rules.awakeningCutsceneDelay, [this, character = def.character]()
			{
				phase_ = BattlePhase::AWAITING_PLAYER_ACTION;
				emitUpdate("The power of " + character + " flows through you!");
			});
		return ActionResult::APPLIED;
	}

	std::string line;
	int damage = 0;
	json extra = json::object();

	switch (action)
	{
	case BattleAction::FAST_ATTACK:
	case BattleAction::STRONG_ATTACK:
	{
		AttackRoll hit = roll_player_attack(action, player_.power, services_.rules, *services_.rng);
		damage = hit.damage;
		if (!hit.hit)
			line = "You missed your strong attack!";
		else
			line = std::string(hit.critical ? "CRITICAL HIT! " : "")
				+ (action == BattleAction::FAST_ATTACK ? "Fast attack" : "Strong attack")
				+ " deals " + std::to_string(damage) + " damage!";
		break;
	}
	case BattleAction::DEFEND:
		player_.isDefending = true;
		line = "You raise your guard.";
		break;
	case BattleAction::AWAKENED_ABILITY:
	{
		damage = perform_awakened_strike(player_, opponent_);
		line = player_.awakenedState.abilityName + "! " + std::to_string(damage) + " damage!";
		extra["abilityUsed"] = player_.awakenedState.abilityName;
		break;
	}
	default:
		break;
	}

	apply_damage(opponent_, damage);
	appendLog(line);
	extra["damageToOpponent"] = damage;

	if (opponent_.health <= 0)
	{
		emitUpdate(line, extra);
		concludeLocked(true);
		return ActionResult::APPLIED;
	}

	phase_ = BattlePhase::AWAITING_OPPONENT_ACTION;
	emitUpdate(line, extra);
	scheduleLocked(services_.rules.opponentTurnDelay, [this] { resolveOpponentTurn(); });
	return ActionResult::APPLIED;
}

void PveBattle::resolveOpponentTurn()
{
	phase_ = BattlePhase::RESOLVING_OPPONENT_ACTION;

	std::string line;
	if (advance_awakening(player_))
	{
		sendTo(channel_, "AWAKENING_END");
		line = "Your awakening fades. ";
	}

	AttackRoll hit = roll_opponent_attack(opponent_.power, services_.rules, *services_.rng);
	int damage = hit.damage;
	line += opponent_.name + " attacks";
	if (hit.critical)
		line += " with a CRITICAL HIT";
	if (player_.isDefending)
	{
		damage = apply_defense(damage, services_.rules);
		line += ", but you defend and take only " + std::to_string(damage) + " damage!";
	}
	else
	{
		line += " and deals " + std::to_string(damage) + " damage!";
	}
	player_.isDefending = false;

	apply_damage(player_, damage);
	appendLog(line);

	json extra{ {"damageToPlayer", damage} };
	if (player_.health <= 0)
	{
		emitUpdate(line, extra);
		concludeLocked(false);
		return;
	}

	phase_ = BattlePhase::AWAITING_PLAYER_ACTION;
	emitUpdate(line, extra);
}

void PveBattle::concludeLocked(bool playerWon)
{
	markFinished();
	const BattleRules& rules = services_.rules;

	if (playerWon)
	{
		std::cout << "[PVE] " << player_.name << " defeated " << opponent_.name << std::endl;
		settle(channel_, userId_, rules.pveWinCoins, rules.pveWinXp,
			json{ {"win", true}, {"message", "VICTORY! You defeated " + opponent_.name + "!"} });
	}
	else
	{
		std::cout << "[PVE] " << player_.name << " was defeated by " << opponent_.name << std::endl;
		settle(channel_, userId_, -rules.pveLossCoins, 0,
			json{ {"win", false}, {"message", "DEFEAT! " + opponent_.name + " was too strong."} });
	}
}

void PveBattle::handleDisconnect(const std::string& connectionId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (finished_ || connectionId != connectionId_)
		return;
	std::cout << "[PVE] " << player_.name << " left battle " << id() << "; discarded" << std::endl;
	markFinished();
}

std::optional<CombatantState> PveBattle::combatant(const std::string& combatantId) const
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (combatantId == player_.id) return player_;
	if (combatantId == opponent_.id) return opponent_;
	return std::nullopt;
}
