#define BOOST_TEST_MODULE BuildCalculatorTests
#include <boost/test/unit_test.hpp>

#include "BuildCalculator.hpp"
#include "GameData.hpp"
#include <string>
#include <vector>

namespace {

OwnedCharacter owned(const std::string& name) {
    const CharacterTemplate* tmpl = find_character_template(name);
    BOOST_REQUIRE(tmpl != nullptr);
    return OwnedCharacter{ "id-" + name, tmpl->name, tmpl->ability, tmpl->rarity };
}

OwnedWeapon weapon(const std::string& name, int bonus, Rarity rarity = Rarity::COMMON) {
    return OwnedWeapon{ "w-" + name, name, "", bonus, rarity };
}

ProgressionRecord attributes(int strength, int vitality) {
    ProgressionRecord p;
    p.strength = strength;
    p.vitality = vitality;
    return p;
}

} // namespace

BOOST_AUTO_TEST_SUITE(BaseStats)

BOOST_AUTO_TEST_CASE(EmptyInventoryUsesAttributesOnly) {
    PlayerBuild b = calculate_player_build(attributes(0, 0), {}, {});
    BOOST_CHECK_EQUAL(b.basePower, 10);
    BOOST_CHECK_EQUAL(b.baseHealth, 50);
    BOOST_CHECK_EQUAL(b.totalPower, 10);
    BOOST_CHECK_EQUAL(b.totalHealth, 50);
    BOOST_CHECK(!b.dominantCollectible);
    BOOST_CHECK(!b.flatBonusCollectible);
    BOOST_CHECK_EQUAL(b.buffSummary, "Nenhum buff ativo");
}

BOOST_AUTO_TEST_CASE(HealthFormulaHoldsForAttributeGrid) {
    for (int str = 0; str <= 20; str += 5) {
        for (int vit = 0; vit <= 20; vit += 4) {
            PlayerBuild b = calculate_player_build(attributes(str, vit), { owned("Arqueiro Élfico") }, {});
            BOOST_CHECK_EQUAL(b.totalHealth, 50 + 10 * vit + b.flatHealthBonus);
            BOOST_CHECK_EQUAL(b.totalPower, 10 + 2 * str);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Bonuses)

BOOST_AUTO_TEST_CASE(PercentBuffsAreFlooredOnceAtTheEnd) {
    PlayerBuild b = calculate_player_build(attributes(0, 0),
        { owned("Feiticeiro Elemental"), owned("Mago Aprendiz") },
        { weapon("Espada Curta", 8) });
    BOOST_CHECK_CLOSE(b.attackPercentBonus, 0.04, 1e-9);
    BOOST_CHECK_EQUAL(b.weaponBonus, 8);
    BOOST_CHECK_EQUAL(b.totalPower, 18); // floor(10 * 1.04 + 8) = floor(18.4)
}

BOOST_AUTO_TEST_CASE(StrongestWeaponOnlyCounts) {
    PlayerBuild b = calculate_player_build(attributes(0, 0), {},
        { weapon("Adaga Enferrujada", 5), weapon("Lâmina Vorpal", 40, Rarity::LEGENDARY), weapon("Machado", 20, Rarity::RARE) });
    BOOST_CHECK_EQUAL(b.weaponBonus, 40);
    BOOST_CHECK_EQUAL(b.totalPower, 50);
}

BOOST_AUTO_TEST_CASE(AllPercentFeedsAttackAndDefense) {
    PlayerBuild b = calculate_player_build(attributes(0, 0), { owned("Deus da Forja Estelar") }, {});
    BOOST_CHECK_CLOSE(b.attackPercentBonus, 0.25, 1e-9);
    BOOST_CHECK_CLOSE(b.defensePercentBonus, 0.25, 1e-9);
}

BOOST_AUTO_TEST_CASE(MixedBuffSplitsIntoAttackAndHealth) {
    // RATO MAROMBA: intrinsic 500/10000 plus +20% attack and +200 health
    PlayerBuild b = calculate_player_build(attributes(0, 0), { owned("RATO MAROMBA") }, {});
    BOOST_CHECK_EQUAL(b.flatAttackBonus, 500);
    BOOST_CHECK_EQUAL(b.flatHealthBonus, 10200);
    BOOST_CHECK_EQUAL(b.totalPower, 612); // floor((10 + 500) * 1.2)
    BOOST_CHECK_EQUAL(b.totalHealth, 10250);
}

BOOST_AUTO_TEST_CASE(BuffsOfEveryOwnedCharacterStack) {
    PlayerBuild b = calculate_player_build(attributes(0, 0),
        { owned("Guerreiro de Taverna"), owned("Arqueiro Élfico"), owned("Arquimago do Tempo") }, {});
    BOOST_CHECK_EQUAL(b.flatHealthBonus, 125);
    BOOST_CHECK_EQUAL(b.totalHealth, 175);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CollectibleSelection)

BOOST_AUTO_TEST_CASE(FlatBonusAndAwakeningGateAreChosenIndependently) {
    // Same rank, so the gate stays on the first owned while the flat bonus
    // follows the higher template health.
    PlayerBuild b = calculate_player_build(attributes(0, 0),
        { owned("Jacket"), owned("RATO MAROMBA") }, {});
    BOOST_REQUIRE(b.flatBonusCollectible);
    BOOST_REQUIRE(b.dominantCollectible);
    BOOST_CHECK_EQUAL(b.flatBonusCollectible->name, "RATO MAROMBA");
    BOOST_CHECK_EQUAL(b.dominantCollectible->name, "Jacket");
}

BOOST_AUTO_TEST_CASE(GateIsTheRarestCharacter) {
    PlayerBuild b = calculate_player_build(attributes(0, 0),
        { owned("Mago Aprendiz"), owned("Avatar do Dragão"), owned("Cavaleiro de Aço") }, {});
    BOOST_REQUIRE(b.dominantCollectible);
    BOOST_CHECK_EQUAL(b.dominantCollectible->name, "Avatar do Dragão");
}

BOOST_AUTO_TEST_CASE(TiesKeepTheFirstOwned) {
    PlayerBuild b = calculate_player_build(attributes(0, 0),
        { owned("Mago Aprendiz"), owned("Ladino de Beco") }, {});
    BOOST_REQUIRE(b.flatBonusCollectible);
    BOOST_CHECK_EQUAL(b.flatBonusCollectible->name, "Mago Aprendiz");
    BOOST_CHECK_EQUAL(b.dominantCollectible->name, "Mago Aprendiz");
}

BOOST_AUTO_TEST_CASE(UnknownCharactersAreIgnored) {
    OwnedCharacter legacy{ "old", "Retired Hero", "Gone", Rarity::RARE };
    PlayerBuild b = calculate_player_build(attributes(0, 0), { legacy }, {});
    BOOST_CHECK_EQUAL(b.totalPower, 10);
    BOOST_CHECK_EQUAL(b.totalHealth, 50);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_CASE(SummaryListsActiveBuffs) {
    PlayerBuild b = calculate_player_build(attributes(0, 0),
        { owned("Feiticeiro Elemental"), owned("Arqueiro Élfico") }, { weapon("Espada Curta", 8) });
    BOOST_CHECK_EQUAL(b.buffSummary, "+3% de Ataque, +20 de Vida, +8 de Ataque (Espada)");
}
