// File: BattleCoordinator.cpp
#include "BattleCoordinator.hpp"
#include "BuildCalculator.hpp"
#include "GameData.hpp"
#include "GameErrors.hpp"
#include "LootTables.hpp"
#include "Progression.hpp"
#include "PveBattle.hpp"
#include "PvpBattle.hpp"
#include <boost/asio/post.hpp>
#include <iostream>

using json = nlohmann::json;

namespace {

void send_error(PlayerChannel& channel, const std::string& message) {
	channel.send("SERVER:ERROR:" + message);
}

void send_matchmaking_update(PlayerChannel& channel, const std::string& status, const std::string& message) {
	channel.send("SERVER:MATCHMAKING_UPDATE:" + json{ {"status", status}, {"message", message} }.dump());
}

} // namespace

BattleCoordinator::BattleCoordinator(net::io_context& ioc, BattleServices services,
	std::shared_ptr<SessionRegistry> sessions, std::shared_ptr<MatchQueue> queue)
	: ioc_(ioc)
	, services_(std::move(services))
	, sessions_(std::move(sessions))
	, queue_(std::move(queue))
{
}

void BattleCoordinator::runBlocking(const std::shared_ptr<PlayerChannel>& channel, const char* what, Work work)
{
	std::weak_ptr<PlayerChannel> weak = channel;
	std::weak_ptr<BattleCoordinator> owner = weak_from_this();
	try
	{
		services_.dbPool->enqueue([owner, weak, what, work = std::move(work)]
			{
				// --- This runs on a DB THREAD ---
				auto ch = weak.lock();
				if (!ch) return; // player left before we got to it
				auto self = owner.lock();
				if (!self) return; // shutting down

				try
				{
					work(*self, ch);
				}
				catch (const PersistenceFailure& e)
				{
					std::cerr << "[DB ERROR] " << what << " for " << ch->userId() << ": " << e.what() << std::endl;
					send_error(*ch, "The server could not reach the database. Please try again.");
				}
				catch (const GameError& e)
				{
					send_error(*ch, e.what());
				}
				catch (const std::exception& e)
				{
					std::cerr << "[ERROR] " << what << " for " << ch->userId() << ": " << e.what() << std::endl;
					send_error(*ch, "An internal server error occurred.");
				}
			});
	}
	catch (const std::exception& e)
	{
		std::cerr << "[ERROR] Could not queue " << what << ": " << e.what() << std::endl;
		send_error(*channel, "The server is shutting down.");
	}
}

void BattleCoordinator::resolveAuth(const std::string& sid, std::function<void(std::optional<std::string>)> onResolved)
{
	auto store = services_.store;
	try
	{
		services_.dbPool->enqueue([store, sid, onResolved = std::move(onResolved)]
			{
				std::optional<std::string> userId;
				try
				{
					userId = store->resolveSession(sid);
				}
				catch (const std::exception& e)
				{
					std::cerr << "[DB ERROR] Session lookup failed: " << e.what() << std::endl;
				}
				onResolved(userId);
			});
	}
	catch (const std::exception& e)
	{
		std::cerr << "[ERROR] Could not queue session lookup: " << e.what() << std::endl;
		onResolved(std::nullopt);
	}
}

void BattleCoordinator::sendBuildNow(PlayerChannel& channel)
{
	PlayerLoadout loadout = services_.store->loadLoadout(channel.userId());
	PlayerBuild build = calculate_player_build(loadout);

	json payload{
		{"username", loadout.profile.username},
		{"coins", loadout.profile.coins},
		{"progression", loadout.profile.progression},
		{"build", build},
		{"characters", loadout.characters},
		{"weapons", loadout.weapons}
	};
	channel.send("SERVER:BUILD:" + payload.dump());
}

void BattleCoordinator::sendBuild(const std::shared_ptr<PlayerChannel>& channel)
{
	runBlocking(channel, "GET_BUILD", [](BattleCoordinator& self, const std::shared_ptr<PlayerChannel>& ch)
		{
			self.sendBuildNow(*ch);
		});
}

void BattleCoordinator::startPveBattle(const std::shared_ptr<PlayerChannel>& channel)
{
	if (sessions_->isBusy(channel->userId()))
	{
		send_error(*channel, "You are already in a battle.");
		return;
	}

	runBlocking(channel, "START_BATTLE", [](BattleCoordinator& self, const std::shared_ptr<PlayerChannel>& ch)
		{
			PlayerLoadout loadout = self.services_.store->loadLoadout(ch->userId());
			PlayerBuild build = calculate_player_build(loadout);
			const OpponentTemplate& opponent = OPPONENTS[self.services_.rng->pick(OPPONENTS.size())];

			auto session = std::make_shared<PveBattle>(self.ioc_, self.services_, ch,
				make_combatant(loadout.profile, build), make_combatant(opponent));

			// Post back to the io_context to register and start it
			std::weak_ptr<BattleCoordinator> owner = self.weak_from_this();
			std::weak_ptr<PlayerChannel> weak = ch;
			net::post(self.ioc_, [owner, session, weak]
				{
					if (auto coordinator = owner.lock())
						coordinator->launch(session, weak);
				});
		});
}

void BattleCoordinator::launch(const std::shared_ptr<BattleSession>& session, const std::weak_ptr<PlayerChannel>& requester)
{
	auto ch = requester.lock();
	if (!ch || !ch->isOpen())
	{
		std::cout << "[BATTLE] Requester left before battle " << session->id() << " started" << std::endl;
		return;
	}

	if (!sessions_->claim(session))
	{
		send_error(*ch, "You are already in a battle.");
		return;
	}

	watch(session);
	session->start();

	// The connection may have closed after the check above, before onDisconnect
	// could see the claim.
	if (!ch->isOpen())
		session->handleDisconnect(ch->connectionId());
}

void BattleCoordinator::watch(const std::shared_ptr<BattleSession>& session)
{
	std::weak_ptr<SessionRegistry> registry = sessions_;
	session->setFinishedHandler([registry](const std::string& sessionId)
		{
			if (auto r = registry.lock())
				r->release(sessionId);
		});
}

ActionResult BattleCoordinator::submitAction(const std::string& sessionId, const std::string& actorId, BattleAction action)
{
	auto session = sessions_->findById(sessionId);
	if (!session)
		return ActionResult::STALE;
	return session->submitAction(actorId, action);
}

ActionResult BattleCoordinator::submitPlayerAction(const std::shared_ptr<PlayerChannel>& channel, BattleAction action)
{
	auto session = sessions_->findByUser(channel->userId());
	ActionResult result = session
		? session->submitAction(channel->userId(), action)
		: ActionResult::STALE;

	if (result == ActionResult::STALE)
	{
		channel->send("SERVER:BATTLE_END:" + json{
			{"stale", true},
			{"message", "This battle has already ended."}
			}.dump());
	}
	return result;
}

void BattleCoordinator::enqueueForMatch(const std::shared_ptr<PlayerChannel>& channel)
{
	if (sessions_->isBusy(channel->userId()))
	{
		send_error(*channel, "You are already in a battle.");
		return;
	}

	runBlocking(channel, "FIND_MATCH", [](BattleCoordinator& self, const std::shared_ptr<PlayerChannel>& ch)
		{
			PlayerLoadout loadout = self.services_.store->loadLoadout(ch->userId());
			PlayerBuild build = calculate_player_build(loadout);

			MatchmakingEntry entry;
			entry.userId = ch->userId();
			entry.connectionId = ch->connectionId();
			entry.channel = ch;
			entry.stats = make_combatant(loadout.profile, build);

			std::weak_ptr<BattleCoordinator> owner = self.weak_from_this();
			net::post(self.ioc_, [owner, entry = std::move(entry)]() mutable
				{
					if (auto coordinator = owner.lock())
						coordinator->queueEntry(std::move(entry));
				});
		});
}

void BattleCoordinator::queueEntry(MatchmakingEntry entry)
{
	std::weak_ptr<PlayerChannel> weak = entry.channel;
	EnqueueResult result = queue_->enqueue(std::move(entry));

	if (auto ch = weak.lock())
	{
		if (result.status == EnqueueStatus::ALREADY_QUEUED)
			send_matchmaking_update(*ch, "already_queued", "You are already in the queue.");
		else
			send_matchmaking_update(*ch, "queued", "Searching for an opponent...");
	}

	if (result.pairing)
		launchMatch(std::move(*result.pairing));
}

void BattleCoordinator::launchMatch(MatchPairing pairing)
{
	auto session = std::make_shared<PvpBattle>(ioc_, services_,
		PvpBattle::Side{ pairing.first.stats, pairing.first.connectionId, pairing.first.channel },
		PvpBattle::Side{ pairing.second.stats, pairing.second.connectionId, pairing.second.channel });

	if (sessions_->claim(session))
	{
		watch(session);
		session->start();
		return;
	}

	// One of them started another battle while waiting. The free one keeps its place.
	std::cout << "[MATCHMAKING] Pairing of " << pairing.first.userId << " and "
		<< pairing.second.userId << " cancelled" << std::endl;
	for (MatchmakingEntry* e : { &pairing.second, &pairing.first })
	{
		auto ch = e->channel.lock();
		if (sessions_->isBusy(e->userId))
		{
			if (ch) send_matchmaking_update(*ch, "cancelled", "You are already in a battle.");
			continue;
		}
		if (ch && ch->isOpen())
			queue_->requeueFront(std::move(*e));
	}

	// Someone may have joined while this pairing was being set up.
	if (auto next = queue_->tryPair())
		launchMatch(std::move(*next));
}

void BattleCoordinator::onDisconnect(const std::string& connectionId, const std::string& userId)
{
	queue_->removeByConnection(connectionId);

	if (userId.empty())
		return;
	if (auto session = sessions_->findByUser(userId))
		session->handleDisconnect(connectionId);
}

void BattleCoordinator::rollCharacter(const std::shared_ptr<PlayerChannel>& channel)
{
	runBlocking(channel, "ROLL_CHARACTER", [](BattleCoordinator& self, const std::shared_ptr<PlayerChannel>& ch)
		{
			const int cost = self.services_.rules.characterRollCost;
			OwnedCharacter granted = purchase_character_roll(*self.services_.store, ch->userId(), cost, *self.services_.rng);

			json payload{ {"character", granted}, {"cost", cost} };
			if (const CharacterTemplate* tmpl = find_character_template(granted.name))
			{
				payload["attack"] = tmpl->attack;
				payload["health"] = tmpl->health;
				payload["buff"] = tmpl->buffDescription;
			}
			ch->send("SERVER:CHARACTER_ROLLED:" + payload.dump());
			self.sendBuildNow(*ch);
		});
}

void BattleCoordinator::rollWeapon(const std::shared_ptr<PlayerChannel>& channel)
{
	runBlocking(channel, "ROLL_WEAPON", [](BattleCoordinator& self, const std::shared_ptr<PlayerChannel>& ch)
		{
			const int cost = self.services_.rules.weaponRollCost;
			OwnedWeapon granted = purchase_weapon_roll(*self.services_.store, ch->userId(), cost, *self.services_.rng);
			ch->send("SERVER:WEAPON_ROLLED:" + json{ {"weapon", granted}, {"cost", cost} }.dump());
			self.sendBuildNow(*ch);
		});
}

void BattleCoordinator::allocateStats(const std::shared_ptr<PlayerChannel>& channel, int strength, int vitality)
{
	if (sessions_->isBusy(channel->userId()))
	{
		send_error(*channel, "You can't change your stats during a battle.");
		return;
	}

	runBlocking(channel, "ALLOCATE_STATS", [strength, vitality](BattleCoordinator& self, const std::shared_ptr<PlayerChannel>& ch)
		{
			spend_stat_points(*self.services_.store, ch->userId(), strength, vitality);
			std::cout << "[STATS] " << ch->userId() << " spent " << strength << " STR / " << vitality << " VIT" << std::endl;
			self.sendBuildNow(*ch);
		});
}
