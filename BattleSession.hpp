// File: BattleSession.hpp
// Description: Base class for one live battle. Owns the combatants, the
// battle log and the timer that drives delayed resolution (opponent turns,
// awakening cutscenes). All state is guarded by one mutex so the two
// connections of a PvP match never write at the same time.
#pragma once

#include "game_session.hpp"
#include "ServerConfig.hpp"
#include "CombatRng.hpp"
#include "PlayerChannel.hpp"
#include "PlayerStore.hpp"
#include "ThreadPool.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace net = boost::asio;

// Collaborators every battle needs. Copied into each session.
struct BattleServices {
	std::shared_ptr<PlayerStore> store;
	std::shared_ptr<ThreadPool> dbPool;
	std::shared_ptr<CombatRng> rng;
	BattleRules rules;
};

enum class BattleKind { PVE, PVP };

enum class BattlePhase {
	STARTING,
	AWAITING_PLAYER_ACTION,
	RESOLVING_PLAYER_ACTION,
	AWAITING_OPPONENT_ACTION,
	RESOLVING_OPPONENT_ACTION,
	AWAKENING_CUTSCENE,
	FINISHED
};

enum class ActionResult {
	APPLIED,
	REJECTED,     // wrong turn, or a delay is still running; state re-sent unchanged
	NOT_ELIGIBLE, // ability not available; state re-sent unchanged
	STALE         // the battle already ended
};

const char* to_string(ActionResult result);

class BattleSession : public std::enable_shared_from_this<BattleSession>
{
public:
	using FinishedHandler = std::function<void(const std::string& sessionId)>;

	virtual ~BattleSession() = default;

	BattleSession(const BattleSession&) = delete;
	BattleSession& operator=(const BattleSession&) = delete;

	const std::string& id() const { return id_; }

	virtual BattleKind kind() const = 0;

	// User ids taking part. Fixed at construction, safe without the lock.
	virtual std::vector<std::string> participants() const = 0;

	// Sends the opening state. Call once, after the session is registered.
	virtual void start() = 0;

	virtual ActionResult submitAction(const std::string& actorId, BattleAction action) = 0;

	// Ends the battle at once if that connection is one of its players.
	// PvP: the other side wins by forfeit. PvE: discarded.
	virtual void handleDisconnect(const std::string& connectionId) = 0;

	virtual std::optional<CombatantState> combatant(const std::string& combatantId) const = 0;

	BattlePhase phase() const;
	bool isFinished() const;
	bool isLocked() const;
	std::vector<std::string> log() const;

	// Called once, with the lock held, when the battle ends for any reason.
	void setFinishedHandler(FinishedHandler handler);

protected:
	BattleSession(net::io_context& ioc, BattleServices services);

	// --- Everything below expects mutex_ to be held ---

	// Locks the battle until the delay elapses, then runs task with the lock held.
	void scheduleLocked(std::chrono::milliseconds delay, std::function<void()> task);

	void markFinished();
	void appendLog(const std::string& line);

	// Connections of every player, for messages that go to all of them.
	virtual std::vector<std::weak_ptr<PlayerChannel>> channels() const = 0;

	// --- No lock needed ---

	static void sendTo(const std::weak_ptr<PlayerChannel>& channel, const std::string& type);
	static void sendTo(const std::weak_ptr<PlayerChannel>& channel, const std::string& type, const nlohmann::json& payload);

	/**
	 * @brief Persists the end-of-battle coins/XP on the db pool, then sends
	 * level-up notifications and BATTLE_END to the player. Coins and XP are
	 * written in one transaction. BATTLE_END always goes out after the write,
	 * with "settled" telling whether it stuck.
	 */
	void settle(std::weak_ptr<PlayerChannel> channel, const std::string& userId,
		int coinDelta, int xp, nlohmann::json endPayload);

	mutable std::mutex mutex_;
	BattleServices services_;
	BattlePhase phase_ = BattlePhase::STARTING;
	bool locked_ = false;
	bool finished_ = false;

private:
	std::string id_;
	net::strand<net::io_context::executor_type> strand_;
	net::steady_timer timer_;
	std::vector<std::string> log_;
	FinishedHandler onFinished_;
};
