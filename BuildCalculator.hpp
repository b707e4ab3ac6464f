// File: BuildCalculator.hpp
// Description: Turns a player's attributes and owned items into combat stats.
#pragma once
#include "game_session.hpp"
#include <vector>

/**
 * @brief Computes the full build for a player.
 *
 * Flat bonuses come from the owned character with the highest template
 * health; the awakening gate is the owned character with the highest rarity.
 * The two picks are independent on purpose. Pure; safe to call from any thread.
 */
PlayerBuild calculate_player_build(const ProgressionRecord& attributes,
	const std::vector<OwnedCharacter>& characters,
	const std::vector<OwnedWeapon>& weapons);

inline PlayerBuild calculate_player_build(const PlayerLoadout& loadout) {
	return calculate_player_build(loadout.profile.progression, loadout.characters, loadout.weapons);
}

// "+9% de Ataque, +25 de Vida" style summary, shown on the build screen.
std::string describe_buffs(const PlayerBuild& build);
