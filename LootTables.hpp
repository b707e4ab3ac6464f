// File: LootTables.hpp
// Description: Rarity-weighted draws for characters and weapons, and the
// paid rolls that charge coins and grant the result in one store call.
#pragma once
#include "Items.hpp"
#include "CombatRng.hpp"
#include <string>

class PlayerStore;

/**
 * @brief Draws a tier on the rarity ladder, then a template uniformly from it.
 * Tiers with chance 0 are never returned.
 */
CharacterTemplate roll_character(CombatRng& rng);

/**
 * @brief Same ladder as characters, restricted to tiers that have weapons.
 * Tiers without weapons are skipped and their mass is spread over the rest.
 */
WeaponTemplate roll_weapon(CombatRng& rng);

// Roll, charge and grant atomically. Throws InsufficientFunds without charging.
OwnedCharacter purchase_character_roll(PlayerStore& store, const std::string& userId, int cost, CombatRng& rng);
OwnedWeapon purchase_weapon_roll(PlayerStore& store, const std::string& userId, int cost, CombatRng& rng);

// Grants the supreme character to userId unless they already own one.
// Returns true when a grant happened.
bool ensure_supreme_character(PlayerStore& store, const std::string& userId);
