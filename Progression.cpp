// File: Progression.cpp
#include "Progression.hpp"
#include "GameErrors.hpp"
#include "PlayerStore.hpp"
#include <cmath>
#include <iostream>

int xp_to_next_level(int level) {
	return static_cast<int>(std::floor(100.0 * std::pow(static_cast<double>(level), 1.5)));
}

std::vector<int> gain_experience(ProgressionRecord& record, int amount, int statPointsPerLevel) {
	std::vector<int> levelsReached;
	if (amount <= 0) return levelsReached;

	record.xp += amount;
	while (record.xp >= record.xpToNextLevel) {
		record.xp -= record.xpToNextLevel;
		record.level++;
		record.statPoints += statPointsPerLevel;
		// uses the new level
		record.xpToNextLevel = xp_to_next_level(record.level);
		levelsReached.push_back(record.level);
	}
	return levelsReached;
}

void allocate_stat_points(ProgressionRecord& record, int strength, int vitality) {
	if (strength < 0 || vitality < 0)
		throw RuleViolation("Stat points cannot be negative.");

	const int total = strength + vitality;
	if (total <= 0 || record.statPoints < total)
		throw RuleViolation("Not enough stat points.");

	record.strength += strength;
	record.vitality += vitality;
	record.statPoints -= total;
}

ExperienceGrant grant_experience(PlayerStore& store, const std::string& userId, int amount, int statPointsPerLevel) {
	ExperienceGrant grant;
	grant.record = store.modifyProgression(userId, [&](ProgressionRecord& record) {
		grant.levelsReached = gain_experience(record, amount, statPointsPerLevel);
		});

	for (int level : grant.levelsReached)
		std::cout << "[Level Up] Player " << userId << " reached level " << level << std::endl;

	return grant;
}

ExperienceGrant grant_battle_rewards(PlayerStore& store, const std::string& userId, int coinDelta, int xp, int statPointsPerLevel) {
	ExperienceGrant grant;
	auto written = store.applyRewards(userId, coinDelta, [&](ProgressionRecord& record) {
		grant.levelsReached = gain_experience(record, xp, statPointsPerLevel);
		});
	grant.balance = written.first;
	grant.record = written.second;

	for (int level : grant.levelsReached)
		std::cout << "[Level Up] Player " << userId << " reached level " << level << std::endl;

	return grant;
}

ProgressionRecord spend_stat_points(PlayerStore& store, const std::string& userId, int strength, int vitality) {
	return store.modifyProgression(userId, [&](ProgressionRecord& record) {
		allocate_stat_points(record, strength, vitality);
		});
}
