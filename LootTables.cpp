// File: LootTables.cpp
#include "LootTables.hpp"
#include "GameData.hpp"
#include "PlayerStore.hpp"
#include <iostream>
#include <map>
#include <stdexcept>
#include <vector>

namespace {

// Walks the ladder in declared order and returns the pool of the first tier
// whose cumulative chance exceeds the draw. Tiers missing from the table or
// with an empty pool take no part in the walk.
template<typename T>
const std::vector<T>& draw_tier(const std::map<Rarity, std::vector<T>>& table, CombatRng& rng)
{
	double rollable = 0.0;
	for (const auto& tier : RARITY_LADDER) {
		auto it = table.find(tier.rarity);
		if (it == table.end() || it->second.empty() || tier.chance <= 0.0) continue;
		rollable += tier.chance;
	}
	if (rollable <= 0.0)
		throw std::logic_error("loot table has no rollable tier");

	const double roll = rng.roll() * rollable;
	double cumulative = 0.0;
	const std::vector<T>* last = nullptr;

	for (const auto& tier : RARITY_LADDER) {
		auto it = table.find(tier.rarity);
		if (it == table.end() || it->second.empty() || tier.chance <= 0.0) continue;

		cumulative += tier.chance;
		last = &it->second;
		if (roll < cumulative)
			return it->second;
	}
	// Only reachable through floating point rounding at the very top
	return *last;
}

} // namespace

CharacterTemplate roll_character(CombatRng& rng)
{
	const auto& pool = draw_tier(CHARACTERS_BY_RARITY, rng);
	return pool[rng.pick(pool.size())];
}

WeaponTemplate roll_weapon(CombatRng& rng)
{
	const auto& pool = draw_tier(WEAPONS_BY_RARITY, rng);
	return pool[rng.pick(pool.size())];
}

OwnedCharacter purchase_character_roll(PlayerStore& store, const std::string& userId, int cost, CombatRng& rng)
{
	CharacterTemplate rolled = roll_character(rng);
	OwnedCharacter granted = store.purchaseCharacter(userId, cost, rolled);
	std::cout << "[LOOT] " << userId << " rolled " << granted.name
		<< " (" << rarity_info(granted.rarity).key << ") for " << cost << " coins" << std::endl;
	return granted;
}

OwnedWeapon purchase_weapon_roll(PlayerStore& store, const std::string& userId, int cost, CombatRng& rng)
{
	WeaponTemplate rolled = roll_weapon(rng);
	OwnedWeapon granted = store.purchaseWeapon(userId, cost, rolled);
	std::cout << "[LOOT] " << userId << " forged " << granted.name
		<< " (+" << granted.attackBonus << ") for " << cost << " coins" << std::endl;
	return granted;
}

bool ensure_supreme_character(PlayerStore& store, const std::string& userId)
{
	if (store.ownsRarity(userId, Rarity::SUPREME)) {
		std::cout << "[LOOT] Supreme character already present for " << userId << std::endl;
		return false;
	}

	const CharacterTemplate* supreme = find_character_template(SUPREME_CHARACTER_NAME);
	if (!supreme)
		throw std::logic_error("supreme character missing from catalog");

	store.purchaseCharacter(userId, 0, *supreme);
	std::cout << "[LOOT] Granted " << supreme->name << " to " << userId << std::endl;
	return true;
}
