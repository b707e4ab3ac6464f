// File: Items.hpp
// Description: Collectible and weapon definitions, both the catalog templates
// and the rows a player owns.
#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>

// Rarity ladder in rank order. The rank is what decides which owned
// character anchors the awakening ability, so keep the order stable.
enum class Rarity : int {
    COMMON = 0,
    RARE = 1,
    LEGENDARY = 2,
    MYTHIC = 3,
    ULTRA_RARE = 4,
    SUPREME = 5
};

// --- Buff kinds granted by owning a character ---
struct NoBuff {};
struct AttackPercentBuff { double value = 0.0; };
struct DefensePercentBuff { double value = 0.0; };
struct HealthFlatBuff { int value = 0; };
struct AttackFlatBuff { int value = 0; };
struct AllPercentBuff { double value = 0.0; }; // attack and defense
struct MixedBuff {
    double attackPercent = 0.0;
    int healthFlat = 0;
};

using Buff = std::variant<NoBuff, AttackPercentBuff, DefensePercentBuff,
    HealthFlatBuff, AttackFlatBuff, AllPercentBuff, MixedBuff>;

// Catalog entry for a character. attack/health are intrinsic template stats,
// only the exclusive and supreme characters carry them.
struct CharacterTemplate {
    std::string name;
    std::string ability;
    Rarity rarity = Rarity::COMMON;
    int attack = 0;
    int health = 0;
    std::string buffDescription;
    Buff buff;
};

struct WeaponTemplate {
    std::string name;
    std::string description;
    int attackBonus = 0;
    Rarity rarity = Rarity::COMMON;
};

// A character row owned by a player. Only the name links it back to its template.
struct OwnedCharacter {
    std::string id;
    std::string name;
    std::string ability;
    Rarity rarity = Rarity::COMMON;
};

struct OwnedWeapon {
    std::string id;
    std::string name;
    std::string description;
    int attackBonus = 0;
    Rarity rarity = Rarity::COMMON;
};
