// File: BattleCoordinator.hpp
// Description: Entry point from a connection into battles, matchmaking,
// rolls and progression. Blocking store work runs on the db pool; battles
// are created and started back on the io_context.
#pragma once
#include "BattleSession.hpp"
#include "MatchQueue.hpp"
#include "SessionRegistry.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

class BattleCoordinator : public std::enable_shared_from_this<BattleCoordinator>
{
public:
	BattleCoordinator(net::io_context& ioc, BattleServices services,
		std::shared_ptr<SessionRegistry> sessions, std::shared_ptr<MatchQueue> queue);

	// Looks up the web session on the db pool. onResolved runs on a db thread.
	void resolveAuth(const std::string& sid, std::function<void(std::optional<std::string>)> onResolved);

	// SERVER:BUILD with profile, inventory and computed stats.
	void sendBuild(const std::shared_ptr<PlayerChannel>& channel);

	void startPveBattle(const std::shared_ptr<PlayerChannel>& channel);

	// Routes to the session by id. STALE when it no longer exists.
	ActionResult submitAction(const std::string& sessionId, const std::string& actorId, BattleAction action);

	// Routes to the player's current battle; tells them when there is none.
	ActionResult submitPlayerAction(const std::shared_ptr<PlayerChannel>& channel, BattleAction action);

	void enqueueForMatch(const std::shared_ptr<PlayerChannel>& channel);

	// Leaves the queue and ends any battle played on this connection.
	void onDisconnect(const std::string& connectionId, const std::string& userId);

	void rollCharacter(const std::shared_ptr<PlayerChannel>& channel);
	void rollWeapon(const std::shared_ptr<PlayerChannel>& channel);
	void allocateStats(const std::shared_ptr<PlayerChannel>& channel, int strength, int vitality);

	SessionRegistry& sessions() { return *sessions_; }
	MatchQueue& queue() { return *queue_; }

private:
	using Work = std::function<void(BattleCoordinator&, const std::shared_ptr<PlayerChannel>&)>;

	// Runs work on the db pool. Errors are logged and answered with SERVER:ERROR.
	// The pending task holds no reference to the coordinator.
	void runBlocking(const std::shared_ptr<PlayerChannel>& channel, const char* what, Work work);

	void launch(const std::shared_ptr<BattleSession>& session, const std::weak_ptr<PlayerChannel>& requester);
	void watch(const std::shared_ptr<BattleSession>& session);
	void queueEntry(MatchmakingEntry entry);
	void launchMatch(MatchPairing pairing);
	void sendBuildNow(PlayerChannel& channel);

	net::io_context& ioc_;
	BattleServices services_;
	std::shared_ptr<SessionRegistry> sessions_;
	std::shared_ptr<MatchQueue> queue_;
};
