// File: GameData.hpp
// Description: Declares the static game catalogs (rarities, characters,
// weapons, opponents, awakenings) and lookup helpers over them.
#pragma once
#include "game_session.hpp" // For OpponentTemplate, Rarity, etc.
#include "Items.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

struct RarityInfo {
	Rarity rarity;
	std::string key;         // DB enum value, e.g. "LENDARIO"
	std::string displayName;
	std::string color;
	double chance;           // 0 means never rolled
};

/**
 * @struct AwakeningDefinition
 * @brief What happens when a character's owner awakens it in battle.
 */
struct AwakeningDefinition {
	std::string character;
	std::string abilityName;
	int damage = 0;
	bool lethal = false; // ignores damage and takes the target's remaining health
	std::vector<std::string> spectatorLines;
	std::string theme;
};

// --- Catalog data ---
// 'extern' means "this variable is defined in a .cpp file somewhere else"
extern const std::vector<RarityInfo> RARITY_LADDER;
extern const std::map<Rarity, std::vector<CharacterTemplate>> CHARACTERS_BY_RARITY;
extern const std::map<std::string, CharacterTemplate> EXCLUSIVE_CHARACTERS;
extern const std::map<Rarity, std::vector<WeaponTemplate>> WEAPONS_BY_RARITY;
extern const std::vector<OpponentTemplate> OPPONENTS;
extern const std::map<std::string, AwakeningDefinition> AWAKENINGS;

// Name of the character granted to the configured admin account.
extern const std::string SUPREME_CHARACTER_NAME;

const RarityInfo& rarity_info(Rarity rarity);
std::optional<Rarity> parse_rarity(const std::string& key);
int rarity_rank(Rarity rarity);

/**
 * @brief Finds a character template by name, exclusives first, then the rarity pools.
 * @return nullptr for names the catalog does not know.
 */
const CharacterTemplate* find_character_template(const std::string& name);

const AwakeningDefinition* find_awakening(const std::string& character);
