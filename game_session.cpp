// File: game_session.cpp
// Description: Helpers for the core combat structs: action parsing,
// combatant construction and the JSON shapes sent to clients.
#include "game_session.hpp"
#include "GameData.hpp"

using json = nlohmann::json;

std::optional<BattleAction> parse_battle_action(const std::string& text) {
    if (text == "fast_attack") return BattleAction::FAST_ATTACK;
    if (text == "strong_attack") return BattleAction::STRONG_ATTACK;
    if (text == "defend") return BattleAction::DEFEND;
    if (text == "use_ability") return BattleAction::USE_ABILITY;
    if (text == "awakened_ability") return BattleAction::AWAKENED_ABILITY;
    return std::nullopt;
}

const char* to_string(BattleAction action) {
    switch (action) {
    case BattleAction::FAST_ATTACK: return "fast_attack";
    case BattleAction::STRONG_ATTACK: return "strong_attack";
    case BattleAction::DEFEND: return "defend";
    case BattleAction::USE_ABILITY: return "use_ability";
    case BattleAction::AWAKENED_ABILITY: return "awakened_ability";
    }
    return "unknown";
}

CombatantState make_combatant(const PlayerProfile& profile, const PlayerBuild& build) {
    CombatantState c;
    c.id = profile.userId;
    c.name = profile.username;
    c.health = build.totalHealth;
    c.maxHealth = build.totalHealth;
    c.power = build.totalPower;
    c.activeCharacter = build.dominantCollectible;
    return c;
}

CombatantState make_combatant(const OpponentTemplate& opponent) {
    CombatantState c;
    c.id = "npc:" + opponent.name;
    c.name = opponent.name;
    c.health = opponent.health;
    c.maxHealth = opponent.health;
    c.power = opponent.power;
    return c;
}

void to_json(json& j, const OwnedCharacter& c) {
    const RarityInfo& info = rarity_info(c.rarity);
    j = json{
        {"id", c.id},
        {"name", c.name},
        {"ability", c.ability},
        {"rarity", info.key},
        {"rarityColor", info.color}
    };
}

void to_json(json& j, const OwnedWeapon& w) {
    j = json{
        {"id", w.id},
        {"name", w.name},
        {"description", w.description},
        {"attackBonus", w.attackBonus},
        {"rarity", rarity_info(w.rarity).key}
    };
}

void to_json(json& j, const AwakenedState& a) {
    j = json{
        {"active", a.active},
        {"character", a.active ? json(a.character) : json(nullptr)},
        {"abilityName", a.abilityName},
        {"turnsLeft", a.turnsLeft}
    };
}

void to_json(json& j, const CombatantState& c) {
    j = json{
        {"id", c.id},
        {"name", c.name},
        {"health", c.health},
        {"maxHealth", c.maxHealth},
        {"power", c.power},
        {"isDefending", c.isDefending},
        {"abilityUsed", c.abilityUsed},
        {"awakenedState", c.awakenedState}
    };
    j["activeCharacter"] = c.activeCharacter ? json(*c.activeCharacter) : json(nullptr);
}

void to_json(json& j, const ProgressionRecord& p) {
    j = json{
        {"level", p.level},
        {"xp", p.xp},
        {"xpToNextLevel", p.xpToNextLevel},
        {"statPoints", p.statPoints},
        {"strength", p.strength},
        {"vitality", p.vitality}
    };
}

void to_json(json& j, const PlayerBuild& b) {
    j = json{
        {"basePower", b.basePower},
        {"baseHealth", b.baseHealth},
        {"flatAttackBonus", b.flatAttackBonus},
        {"flatHealthBonus", b.flatHealthBonus},
        {"attackPercentBonus", b.attackPercentBonus},
        {"defensePercentBonus", b.defensePercentBonus},
        {"weaponBonus", b.weaponBonus},
        {"totalPower", b.totalPower},
        {"totalHealth", b.totalHealth},
        {"buffs", b.buffSummary}
    };
    j["activeCharacter"] = b.dominantCollectible ? json(*b.dominantCollectible) : json(nullptr);
}
