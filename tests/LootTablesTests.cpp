#define BOOST_TEST_MODULE LootTablesTests
#include <boost/test/unit_test.hpp>

#include "LootTables.hpp"
#include "TestSupport.hpp"
#include <map>
#include <set>

BOOST_AUTO_TEST_SUITE(CharacterRolls)

BOOST_AUTO_TEST_CASE(LowestDrawLandsOnCommon) {
    ScriptedRng rng;
    rng.push({ 0.0, 0.0 });
    CharacterTemplate c = roll_character(rng);
    BOOST_CHECK(c.rarity == Rarity::COMMON);
    BOOST_CHECK_EQUAL(c.name, "Guerreiro de Taverna");
}

BOOST_AUTO_TEST_CASE(TopOfTheLadderIsUltraRare) {
    ScriptedRng rng;
    rng.push({ 0.9999, 0.0 });
    CharacterTemplate c = roll_character(rng);
    BOOST_CHECK(c.rarity == Rarity::ULTRA_RARE);
}

BOOST_AUTO_TEST_CASE(SupremeIsNeverRolled) {
    MersenneRng rng(1234);
    std::map<Rarity, int> seen;
    for (int i = 0; i < 20000; ++i)
        seen[roll_character(rng).rarity]++;

    BOOST_CHECK_EQUAL(seen.count(Rarity::SUPREME), 0u);
    // 60% common, loosely
    BOOST_CHECK_GT(seen[Rarity::COMMON], 11000);
    BOOST_CHECK_LT(seen[Rarity::COMMON], 13000);
    BOOST_CHECK_GT(seen[Rarity::RARE], seen[Rarity::LEGENDARY]);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WeaponRolls)

BOOST_AUTO_TEST_CASE(OnlyTiersWithWeaponsAreDrawn) {
    MersenneRng rng(99);
    std::set<Rarity> seen;
    for (int i = 0; i < 5000; ++i)
        seen.insert(roll_weapon(rng).rarity);

    BOOST_CHECK(seen.count(Rarity::COMMON));
    BOOST_CHECK(seen.count(Rarity::RARE));
    BOOST_CHECK(seen.count(Rarity::LEGENDARY));
    BOOST_CHECK_EQUAL(seen.size(), 3u);
}

BOOST_AUTO_TEST_CASE(HighDrawIsRenormalizedOntoLegendary) {
    // 0.99 of the 0.95 weapon mass is past COMMON + RARE
    ScriptedRng rng;
    rng.push({ 0.99, 0.0 });
    WeaponTemplate w = roll_weapon(rng);
    BOOST_CHECK(w.rarity == Rarity::LEGENDARY);
    BOOST_CHECK_EQUAL(w.name, "Lâmina Vorpal");
    BOOST_CHECK_EQUAL(w.attackBonus, 40);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Purchases)

BOOST_AUTO_TEST_CASE(ShortBalanceChargesNothing) {
    MemoryPlayerStore store;
    store.addPlayer("u1", "ana", 50);
    ScriptedRng rng;

    BOOST_CHECK_THROW(purchase_character_roll(store, "u1", 100, rng), InsufficientFunds);
    BOOST_CHECK_EQUAL(store.coins("u1"), 50);
    BOOST_CHECK(store.snapshot("u1").characters.empty());

    BOOST_CHECK_THROW(purchase_weapon_roll(store, "u1", 75, rng), InsufficientFunds);
    BOOST_CHECK(store.snapshot("u1").weapons.empty());
}

BOOST_AUTO_TEST_CASE(InsufficientFundsCarriesBothAmounts) {
    MemoryPlayerStore store;
    store.addPlayer("u1", "ana", 30);
    ScriptedRng rng;
    try {
        purchase_weapon_roll(store, "u1", 75, rng);
        BOOST_FAIL("expected InsufficientFunds");
    }
    catch (const InsufficientFunds& e) {
        BOOST_CHECK_EQUAL(e.required(), 75);
        BOOST_CHECK_EQUAL(e.available(), 30);
        BOOST_CHECK_EQUAL(std::string(e.what()), "Not enough coins! You need 75 coins.");
    }
}

BOOST_AUTO_TEST_CASE(SuccessfulRollChargesAndGrants) {
    MemoryPlayerStore store;
    store.addPlayer("u1", "ana", 150);
    ScriptedRng rng;
    rng.push({ 0.7, 0.0 }); // RARE tier, first template

    OwnedCharacter c = purchase_character_roll(store, "u1", 100, rng);
    BOOST_CHECK_EQUAL(c.name, "Cavaleiro de Aço");
    BOOST_CHECK_EQUAL(store.coins("u1"), 50);
    BOOST_REQUIRE_EQUAL(store.snapshot("u1").characters.size(), 1u);
    BOOST_CHECK_EQUAL(store.snapshot("u1").characters[0].id, c.id);
}

BOOST_AUTO_TEST_CASE(SupremeGrantIsIdempotent) {
    MemoryPlayerStore store;
    store.addPlayer("admin", "root", 0);

    BOOST_CHECK(ensure_supreme_character(store, "admin"));
    BOOST_CHECK(!ensure_supreme_character(store, "admin"));

    auto characters = store.snapshot("admin").characters;
    BOOST_REQUIRE_EQUAL(characters.size(), 1u);
    BOOST_CHECK_EQUAL(characters[0].name, SUPREME_CHARACTER_NAME);
    BOOST_CHECK(characters[0].rarity == Rarity::SUPREME);
    BOOST_CHECK_EQUAL(store.coins("admin"), 0);
}

BOOST_AUTO_TEST_SUITE_END()
