#define BOOST_TEST_MODULE PveBattleTests
#include <boost/test/unit_test.hpp>

#include "PveBattle.hpp"
#include "TestSupport.hpp"
#include <algorithm>
#include <chrono>

namespace {

struct PveFixture : BattleFixture {
    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>("conn-p1", "p1");

    std::shared_ptr<PveBattle> makeBattle(CombatantState player, CombatantState opponent) {
        auto battle = std::make_shared<PveBattle>(ioc, services(), channel, std::move(player), std::move(opponent));
        battle->start();
        return battle;
    }

    int healthOf(const std::shared_ptr<PveBattle>& battle, const std::string& id) {
        auto c = battle->combatant(id);
        BOOST_REQUIRE(c);
        return c->health;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(Turns, PveFixture)

BOOST_AUTO_TEST_CASE(OpeningUpdateAnnouncesTheOpponent) {
    auto battle = makeBattle(test_combatant("p1", 100, 200), test_combatant("npc", 120, 150));

    BOOST_CHECK(battle->phase() == BattlePhase::AWAITING_PLAYER_ACTION);
    auto update = channel->last("BATTLE_UPDATE").json();
    BOOST_CHECK_EQUAL(update["log"].get<std::string>(), "A wild npc appears!");
    BOOST_CHECK(update["isPlayerTurn"].get<bool>());
    BOOST_CHECK(!update["canUseAbility"].get<bool>());
    BOOST_CHECK_EQUAL(update["opponent"]["health"].get<int>(), 150);
}

BOOST_AUTO_TEST_CASE(FastAttackThenRetaliation) {
    auto battle = makeBattle(test_combatant("p1", 100, 200), test_combatant("npc", 120, 150));
    rng->push({ 0.99, 0.5 });

    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::APPLIED);
    BOOST_CHECK_EQUAL(healthOf(battle, "npc"), 100);
    BOOST_CHECK(battle->phase() == BattlePhase::AWAITING_OPPONENT_ACTION);
    BOOST_CHECK(!channel->last("BATTLE_UPDATE").json()["isPlayerTurn"].get<bool>());

    run(); // opponent: no crit, centre variance, 120 * 0.8
    BOOST_CHECK_EQUAL(healthOf(battle, "p1"), 104);
    BOOST_CHECK(battle->phase() == BattlePhase::AWAITING_PLAYER_ACTION);

    auto update = channel->last("BATTLE_UPDATE").json();
    BOOST_CHECK_EQUAL(update["damageToPlayer"].get<int>(), 96);
    BOOST_CHECK(update["isPlayerTurn"].get<bool>());
    BOOST_CHECK_EQUAL(battle->log().size(), 3u);
}

BOOST_AUTO_TEST_CASE(DefendingCutsTheNextHitOnce) {
    auto battle = makeBattle(test_combatant("p1", 100, 200), test_combatant("npc", 120, 150));

    battle->submitAction("p1", BattleAction::DEFEND);
    BOOST_CHECK(battle->combatant("p1")->isDefending);
    run();
    BOOST_CHECK_EQUAL(healthOf(battle, "p1"), 172); // floor(96 * 0.3) = 28
    BOOST_CHECK(!battle->combatant("p1")->isDefending);

    rng->push({ 0.99, 0.5 });
    battle->submitAction("p1", BattleAction::FAST_ATTACK);
    run();
    BOOST_CHECK_EQUAL(healthOf(battle, "p1"), 76);
}

BOOST_AUTO_TEST_CASE(ActionsDuringTheOpponentDelayAreRejected) {
    rules.opponentTurnDelay = std::chrono::hours(1);
    auto battle = makeBattle(test_combatant("p1", 100, 200), test_combatant("npc", 120, 150));

    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::APPLIED);
    BOOST_CHECK(battle->isLocked());
    const int opponentHealth = healthOf(battle, "npc");

    BOOST_CHECK(battle->submitAction("p1", BattleAction::STRONG_ATTACK) == ActionResult::REJECTED);
    BOOST_CHECK_EQUAL(channel->last("BATTLE_UPDATE").json()["log"].get<std::string>(), "Wait for your turn!");
    BOOST_CHECK_EQUAL(healthOf(battle, "npc"), opponentHealth);

    battle->handleDisconnect("conn-p1"); // cancels the pending turn
    run();
}

BOOST_AUTO_TEST_CASE(OnlyTheOwnerMayAct) {
    auto battle = makeBattle(test_combatant("p1", 100, 200), test_combatant("npc", 120, 150));
    BOOST_CHECK(battle->submitAction("someone-else", BattleAction::FAST_ATTACK) == ActionResult::REJECTED);
    BOOST_CHECK_EQUAL(healthOf(battle, "npc"), 150);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(Settlement, PveFixture)

BOOST_AUTO_TEST_CASE(OverkillPaysOutOnce) {
    store->addPlayer("p1", "ana", 100);
    auto battle = makeBattle(test_combatant("p1", 1000, 200), test_combatant("npc", 120, 150));

    rng->push({ 0.99, 0.5 });
    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::APPLIED);
    BOOST_CHECK(battle->isFinished());
    BOOST_CHECK_EQUAL(healthOf(battle, "npc"), 0);
    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::STALE);
    run();

    BOOST_CHECK_EQUAL(channel->count("BATTLE_END"), 1);
    auto end = channel->last("BATTLE_END").json();
    BOOST_CHECK(end["win"].get<bool>());
    BOOST_CHECK(end["settled"].get<bool>());
    BOOST_CHECK_EQUAL(end["coinsChange"].get<int>(), 50);
    BOOST_CHECK_EQUAL(end["xpGained"].get<int>(), 50);
    BOOST_CHECK_EQUAL(end["balance"].get<int>(), 150);

    BOOST_CHECK_EQUAL(store->coins("p1"), 150);
    BOOST_CHECK_EQUAL(store->snapshot("p1").profile.progression.xp, 50);
    BOOST_CHECK_EQUAL(channel->last("NOTIFICATION").payload, "+50 XP!");
}

BOOST_AUTO_TEST_CASE(NotificationsPrecedeTheEndMessage) {
    ProgressionRecord nearLevel;
    nearLevel.xp = 90;
    store->addPlayer("p1", "ana", 0, nearLevel);
    auto battle = makeBattle(test_combatant("p1", 1000, 200), test_combatant("npc", 120, 150));

    battle->submitAction("p1", BattleAction::FAST_ATTACK);
    run();

    auto types = channel->types();
    auto end = std::find(types.begin(), types.end(), "BATTLE_END");
    BOOST_REQUIRE(end != types.end());
    BOOST_CHECK_EQUAL(std::count(types.begin(), end, "NOTIFICATION"), 2);
    BOOST_CHECK_EQUAL(channel->last("NOTIFICATION").payload, "You reached level 2!");
    BOOST_CHECK_EQUAL(channel->last("BATTLE_END").json()["progression"]["level"].get<int>(), 2);
}

BOOST_AUTO_TEST_CASE(DefeatNeverTakesTheBalanceBelowZero) {
    store->addPlayer("p1", "ana", 10);
    auto battle = makeBattle(test_combatant("p1", 1, 10), test_combatant("npc", 120, 150));

    battle->submitAction("p1", BattleAction::FAST_ATTACK);
    run();

    BOOST_CHECK(battle->isFinished());
    auto end = channel->last("BATTLE_END").json();
    BOOST_CHECK(!end["win"].get<bool>());
    BOOST_CHECK_EQUAL(end["coinsChange"].get<int>(), -25);
    BOOST_CHECK_EQUAL(end["balance"].get<int>(), 0);
    BOOST_CHECK_EQUAL(store->coins("p1"), 0);
    BOOST_CHECK_EQUAL(store->progressionWrites, 0);
    BOOST_CHECK_EQUAL(channel->count("NOTIFICATION"), 0);
}

BOOST_AUTO_TEST_CASE(FailedWriteIsReportedAsUnsettled) {
    store->addPlayer("p1", "ana", 100);
    store->setFailing(true);
    auto battle = makeBattle(test_combatant("p1", 1000, 200), test_combatant("npc", 120, 150));

    battle->submitAction("p1", BattleAction::FAST_ATTACK);
    run();

    auto end = channel->last("BATTLE_END").json();
    BOOST_CHECK(!end["settled"].get<bool>());
    BOOST_CHECK_EQUAL(channel->count("NOTIFICATION"), 0);
    BOOST_CHECK_EQUAL(channel->count("ERROR"), 1);

    store->setFailing(false);
    BOOST_CHECK_EQUAL(store->coins("p1"), 100);
}

BOOST_AUTO_TEST_CASE(CoinsAreNotKeptWhenTheExperienceWriteFails) {
    store->addPlayer("p1", "ana", 100);
    store->setProgressionFailing(true);
    auto battle = makeBattle(test_combatant("p1", 1000, 200), test_combatant("npc", 120, 150));

    battle->submitAction("p1", BattleAction::FAST_ATTACK);
    run();

    BOOST_CHECK(!channel->last("BATTLE_END").json()["settled"].get<bool>());
    BOOST_CHECK_EQUAL(store->coins("p1"), 100);
    BOOST_CHECK_EQUAL(store->snapshot("p1").profile.progression.xp, 0);
}

BOOST_AUTO_TEST_CASE(ErrorDuringOpponentTurnEndsTheBattleForThePlayer) {
    store->addPlayer("p1", "ana", 100);
    auto battle = makeBattle(test_combatant("p1", 100, 200), test_combatant("npc", 120, 150));
    std::string released;
    battle->setFinishedHandler([&released](const std::string& id) { released = id; });

    rng->push({ 0.99, 0.5 });
    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::APPLIED);
    rng->setBroken(true);
    run();

    BOOST_CHECK(battle->isFinished());
    BOOST_CHECK_EQUAL(released, battle->id());
    auto end = channel->last("BATTLE_END").json();
    BOOST_CHECK(end["aborted"].get<bool>());
    BOOST_CHECK(!end["settled"].get<bool>());
    BOOST_CHECK_EQUAL(store->coins("p1"), 100);
    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::STALE);
}

BOOST_AUTO_TEST_CASE(AbandonedBattleIsDiscarded) {
    store->addPlayer("p1", "ana", 100);
    auto battle = makeBattle(test_combatant("p1", 100, 200), test_combatant("npc", 120, 150));

    battle->handleDisconnect("conn-other-tab");
    BOOST_CHECK(!battle->isFinished());

    battle->handleDisconnect("conn-p1");
    BOOST_CHECK(battle->isFinished());
    run();

    BOOST_CHECK_EQUAL(channel->count("BATTLE_END"), 0);
    BOOST_CHECK_EQUAL(store->coins("p1"), 100);
    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::STALE);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(Awakening, PveFixture)

BOOST_AUTO_TEST_CASE(AbilityIsOfferedOnlyWithAnAwakening) {
    auto battle = makeBattle(test_combatant("p1", 100, 200, "Mago Aprendiz"), test_combatant("npc", 120, 150));
    BOOST_CHECK(!channel->last("BATTLE_UPDATE").json()["canUseAbility"].get<bool>());
    BOOST_CHECK(battle->submitAction("p1", BattleAction::USE_ABILITY) == ActionResult::NOT_ELIGIBLE);
    BOOST_CHECK(battle->submitAction("p1", BattleAction::AWAKENED_ABILITY) == ActionResult::NOT_ELIGIBLE);
    BOOST_CHECK(battle->phase() == BattlePhase::AWAITING_PLAYER_ACTION);
}

BOOST_AUTO_TEST_CASE(AwakeningLastsThreeEnemyTurns) {
    auto battle = makeBattle(test_combatant("p1", 10, 100000, "Jacket"), test_combatant("npc", 10, 100000));
    BOOST_CHECK(channel->last("BATTLE_UPDATE").json()["canUseAbility"].get<bool>());

    BOOST_CHECK(battle->submitAction("p1", BattleAction::USE_ABILITY) == ActionResult::APPLIED);
    BOOST_CHECK(battle->phase() == BattlePhase::AWAKENING_CUTSCENE);
    BOOST_CHECK_EQUAL(channel->last("PLAY_AWAKENING").json()["character"].get<std::string>(), "Jacket");
    BOOST_CHECK(battle->submitAction("p1", BattleAction::FAST_ATTACK) == ActionResult::REJECTED);
    run();

    // Cutscene over, the player keeps the turn
    BOOST_CHECK(battle->phase() == BattlePhase::AWAITING_PLAYER_ACTION);
    BOOST_CHECK(battle->submitAction("p1", BattleAction::USE_ABILITY) == ActionResult::NOT_ELIGIBLE);

    BOOST_CHECK(battle->submitAction("p1", BattleAction::AWAKENED_ABILITY) == ActionResult::APPLIED);
    BOOST_CHECK_EQUAL(healthOf(battle, "npc"), 100000 - 300);
    run();
    BOOST_CHECK(battle->combatant("p1")->awakenedState.active);

    battle->submitAction("p1", BattleAction::FAST_ATTACK);
    run();
    BOOST_CHECK(battle->combatant("p1")->awakenedState.active);
    BOOST_CHECK_EQUAL(channel->count("AWAKENING_END"), 0);

    battle->submitAction("p1", BattleAction::FAST_ATTACK);
    run();
    BOOST_CHECK(!battle->combatant("p1")->awakenedState.active);
    BOOST_CHECK(battle->combatant("p1")->abilityUsed);
    BOOST_CHECK_EQUAL(channel->count("AWAKENING_END"), 1);

    auto types = channel->types();
    auto fade = std::find(types.begin(), types.end(), "AWAKENING_END");
    BOOST_REQUIRE(fade + 1 != types.end());
    BOOST_CHECK_EQUAL(*(fade + 1), "BATTLE_UPDATE");

    BOOST_CHECK(battle->submitAction("p1", BattleAction::AWAKENED_ABILITY) == ActionResult::NOT_ELIGIBLE);
}

BOOST_AUTO_TEST_CASE(LethalAwakeningEndsTheBattle) {
    store->addPlayer("p1", "admin", 0);
    auto battle = makeBattle(test_combatant("p1", 10, 500, "The Overlord"), test_combatant("npc", 350, 400));

    battle->submitAction("p1", BattleAction::USE_ABILITY);
    run();
    battle->submitAction("p1", BattleAction::AWAKENED_ABILITY);
    BOOST_CHECK(battle->isFinished());
    run();

    BOOST_CHECK_EQUAL(healthOf(battle, "npc"), 0);
    BOOST_CHECK(channel->last("BATTLE_END").json()["win"].get<bool>());
}

BOOST_AUTO_TEST_SUITE_END()
