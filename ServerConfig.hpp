// File: ServerConfig.hpp
// Description: Server settings and battle tuning, loaded from a JSON file
// with environment overrides for deployment secrets.
#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @struct BattleRules
 * @brief Every number that decides a battle or a purchase.
 * Defaults are the live balance values.
 */
struct BattleRules {
	// Player attacks
	double fastAttackRatio = 0.5;
	double fastAttackVariance = 0.10;
	double strongAttackRatio = 1.0;
	double strongAttackVariance = 0.20;
	double strongAttackHitChance = 0.70;
	double playerCritChance = 0.10;

	// Scripted opponent
	double opponentAttackRatio = 0.8;
	double opponentAttackVariance = 0.20;
	double opponentCritChance = 0.05;

	double critMultiplier = 1.5;
	double defendDamageFactor = 0.3; // damage kept when defending
	int awakeningTurns = 3;

	std::chrono::milliseconds opponentTurnDelay{ 1500 };
	std::chrono::milliseconds awakeningCutsceneDelay{ 4500 };
	std::chrono::milliseconds matchStartDelay{ 500 };

	// Settlement
	int pveWinCoins = 50;
	int pveWinXp = 50;
	int pveLossCoins = 25;
	int pvpWinCoins = 0;
	int pvpWinXp = 75;

	int statPointsPerLevel = 5;
	int characterRollCost = 150;
	int weaponRollCost = 250;
};

struct ServerConfig {
	std::string address = "0.0.0.0";
	unsigned short port = 8080;
	std::string databaseUrl;
	int dbThreads = 4;
	std::string adminUserId; // receives the supreme character on startup
	BattleRules rules;
};

void from_json(const nlohmann::json& j, BattleRules& rules);
void from_json(const nlohmann::json& j, ServerConfig& config);

/**
 * @brief Reads the config file, then applies DATABASE_URL / ARENA_PORT from the environment.
 * A missing file yields the defaults. A malformed one throws.
 */
ServerConfig load_server_config(const std::string& path);
