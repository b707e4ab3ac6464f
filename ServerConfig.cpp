// File: ServerConfig.cpp
#include "ServerConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template<typename T>
void read_if_present(const json& j, const char* key, T& out)
{
	auto it = j.find(key);
	if (it != j.end() && !it->is_null())
		out = it->get<T>();
}

void read_ms_if_present(const json& j, const char* key, std::chrono::milliseconds& out)
{
	auto it = j.find(key);
	if (it != j.end() && !it->is_null())
		out = std::chrono::milliseconds(it->get<long long>());
}

} // namespace

void from_json(const json& j, BattleRules& rules)
{
	read_if_present(j, "fast_attack_ratio", rules.fastAttackRatio);
	read_if_present(j, "fast_attack_variance", rules.fastAttackVariance);
	read_if_present(j, "strong_attack_ratio", rules.strongAttackRatio);
	read_if_present(j, "strong_attack_variance", rules.strongAttackVariance);
	read_if_present(j, "strong_attack_hit_chance", rules.strongAttackHitChance);
	read_if_present(j, "player_crit_chance", rules.playerCritChance);
	read_if_present(j, "opponent_attack_ratio", rules.opponentAttackRatio);
	read_if_present(j, "opponent_attack_variance", rules.opponentAttackVariance);
	read_if_present(j, "opponent_crit_chance", rules.opponentCritChance);
	read_if_present(j, "crit_multiplier", rules.critMultiplier);
	read_if_present(j, "defend_damage_factor", rules.defendDamageFactor);
	read_if_present(j, "awakening_turns", rules.awakeningTurns);
	read_ms_if_present(j, "opponent_turn_delay_ms", rules.opponentTurnDelay);
	read_ms_if_present(j, "awakening_cutscene_delay_ms", rules.awakeningCutsceneDelay);
	read_ms_if_present(j, "match_start_delay_ms", rules.matchStartDelay);
	read_if_present(j, "pve_win_coins", rules.pveWinCoins);
	read_if_present(j, "pve_win_xp", rules.pveWinXp);
	read_if_present(j, "pve_loss_coins", rules.pveLossCoins);
	read_if_present(j, "pvp_win_coins", rules.pvpWinCoins);
	read_if_present(j, "pvp_win_xp", rules.pvpWinXp);
	read_if_present(j, "stat_points_per_level", rules.statPointsPerLevel);
	read_if_present(j, "character_roll_cost", rules.characterRollCost);
	read_if_present(j, "weapon_roll_cost", rules.weaponRollCost);

	if (rules.awakeningTurns < 1)
		throw std::runtime_error("awakening_turns must be at least 1");
}

void from_json(const json& j, ServerConfig& config)
{
	read_if_present(j, "address", config.address);
	read_if_present(j, "port", config.port);
	read_if_present(j, "database_url", config.databaseUrl);
	read_if_present(j, "db_threads", config.dbThreads);
	read_if_present(j, "admin_user_id", config.adminUserId);

	auto rules = j.find("battle");
	if (rules != j.end())
		config.rules = rules->get<BattleRules>();
}

ServerConfig load_server_config(const std::string& path)
{
	ServerConfig config;

	std::ifstream in(path);
	if (in)
	{
		try {
			config = json::parse(in).get<ServerConfig>();
			std::cout << "[CONFIG] Loaded " << path << std::endl;
		}
		catch (const json::exception& e) {
			throw std::runtime_error("Config " + path + ": " + e.what());
		}
	}
	else
	{
		std::cout << "[CONFIG] " << path << " not found, using defaults." << std::endl;
	}

	if (const char* url = std::getenv("DATABASE_URL"))
		config.databaseUrl = url;

	if (const char* port = std::getenv("ARENA_PORT"))
	{
		try {
			int value = std::stoi(port);
			if (value <= 0 || value > 65535)
				throw std::out_of_range("port");
			config.port = static_cast<unsigned short>(value);
		}
		catch (const std::exception&) {
			throw std::runtime_error(std::string("ARENA_PORT is not a valid port: ") + port);
		}
	}

	if (config.dbThreads < 1)
		config.dbThreads = 1;

	return config;
}
