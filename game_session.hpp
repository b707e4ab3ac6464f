// File: game_session.hpp
// Description: Defines the core player and combat data structures.
// Battle actions, player records and the combatant state shared by PvE and PvP.
#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "Items.hpp"  // <-- Rarity, OwnedCharacter, OwnedWeapon

/**
 * @enum BattleAction
 * @brief Everything a combatant can ask for on their turn.
 */
enum class BattleAction : int {
    FAST_ATTACK = 0,
    STRONG_ATTACK = 1,
    DEFEND = 2,
    USE_ABILITY = 3,
    AWAKENED_ABILITY = 4
};

std::optional<BattleAction> parse_battle_action(const std::string& text);
const char* to_string(BattleAction action);

// Persisted leveling fields of a user.
struct ProgressionRecord {
    int level = 1;
    int xp = 0;
    int xpToNextLevel = 100;
    int statPoints = 0;
    int strength = 0;
    int vitality = 0;
};

struct PlayerProfile {
    std::string userId;
    std::string username;
    int coins = 0;
    ProgressionRecord progression;
};

// Everything the build calculator needs about a player, read in one go.
struct PlayerLoadout {
    PlayerProfile profile;
    std::vector<OwnedCharacter> characters;
    std::vector<OwnedWeapon> weapons;
};

/**
 * @struct PlayerBuild
 * @brief Derived combat stats. Recomputed at every battle start, never stored.
 */
struct PlayerBuild {
    int basePower = 0;
    int baseHealth = 0;
    int flatAttackBonus = 0;
    int flatHealthBonus = 0;
    double attackPercentBonus = 0.0;
    double defensePercentBonus = 0.0;
    int weaponBonus = 0;

    // Highest intrinsic health; feeds the flat bonuses.
    std::optional<OwnedCharacter> flatBonusCollectible;
    // Highest rarity; gates the awakening ability.
    std::optional<OwnedCharacter> dominantCollectible;

    int totalPower = 0;
    int totalHealth = 0;
    std::string buffSummary;
};

struct AwakenedState {
    bool active = false;
    std::string character;
    std::string abilityName;
    int turnsLeft = 0;
    // Set when an awakened strike already paid for this round.
    bool chargeSpent = false;
};

/**
 * @struct CombatantState
 * @brief One side of a battle. Owned by exactly one battle session.
 */
struct CombatantState {
    std::string id;
    std::string name;
    int health = 0;
    int maxHealth = 0;
    int power = 0;
    bool isDefending = false;
    std::optional<OwnedCharacter> activeCharacter;
    bool abilityUsed = false;
    AwakenedState awakenedState;
};

// Template for the scripted PvE enemies.
struct OpponentTemplate {
    std::string name;
    int power = 0;
    int health = 0;
};

CombatantState make_combatant(const PlayerProfile& profile, const PlayerBuild& build);
CombatantState make_combatant(const OpponentTemplate& opponent);

void to_json(nlohmann::json& j, const OwnedCharacter& c);
void to_json(nlohmann::json& j, const OwnedWeapon& w);
void to_json(nlohmann::json& j, const AwakenedState& a);
void to_json(nlohmann::json& j, const CombatantState& c);
void to_json(nlohmann::json& j, const ProgressionRecord& p);
void to_json(nlohmann::json& j, const PlayerBuild& b);
