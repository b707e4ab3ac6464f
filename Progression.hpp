// File: Progression.hpp
// Description: Experience, level-ups and stat point spending.
#pragma once
#include "game_session.hpp"
#include <string>
#include <vector>

class PlayerStore;

// floor(100 * level^1.5)
int xp_to_next_level(int level);

/**
 * @brief Adds XP and resolves every level-up it pays for.
 * Overflow rolls over, so one call can gain several levels.
 * @return The level reached by each level-up, in order (one entry per notification).
 */
std::vector<int> gain_experience(ProgressionRecord& record, int amount, int statPointsPerLevel = 5);

// Moves unspent stat points into strength/vitality. Throws RuleViolation
// when the total is not positive or exceeds the available points.
void allocate_stat_points(ProgressionRecord& record, int strength, int vitality);

struct ExperienceGrant {
	ProgressionRecord record;
	std::vector<int> levelsReached;
	int balance = 0; // set by grant_battle_rewards
};

// Applies gain_experience inside one store transaction; persisted once.
ExperienceGrant grant_experience(PlayerStore& store, const std::string& userId, int amount, int statPointsPerLevel);

// Same, with a coin delta committed in the same transaction.
ExperienceGrant grant_battle_rewards(PlayerStore& store, const std::string& userId, int coinDelta, int xp, int statPointsPerLevel);

ProgressionRecord spend_stat_points(PlayerStore& store, const std::string& userId, int strength, int vitality);
