// File: MatchQueue.hpp
// Description: FIFO of players waiting for a PvP opponent.
#pragma once
#include "game_session.hpp"
#include "PlayerChannel.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct MatchmakingEntry {
	std::string userId;
	std::string connectionId;
	std::weak_ptr<PlayerChannel> channel;
	CombatantState stats; // from the build computed at enqueue time

	bool isConnected() const;
};

struct MatchPairing {
	MatchmakingEntry first;
	MatchmakingEntry second;
};

enum class EnqueueStatus {
	QUEUED,
	PAIRED,
	ALREADY_QUEUED
};

struct EnqueueResult {
	EnqueueStatus status = EnqueueStatus::QUEUED;
	std::optional<MatchPairing> pairing; // set when PAIRED
};

class MatchQueue {
public:
	/**
	 * @brief Appends the entry, then pairs the two oldest entries if there are two.
	 *
	 * When one of the two has lost its connection, the other goes back to the
	 * front and no pairing happens this time.
	 */
	EnqueueResult enqueue(MatchmakingEntry entry);

	// Puts an entry back at the head, e.g. when its pairing could not start.
	void requeueFront(MatchmakingEntry entry);

	// Pairs the two oldest entries if there are two, with the same rules as enqueue.
	std::optional<MatchPairing> tryPair();

	// Removes the entry for that connection. Order of the others is kept.
	bool removeByConnection(const std::string& connectionId);

	std::size_t size() const;
	std::vector<std::string> waitingUsers() const;

private:
	std::optional<MatchPairing> pairLocked();

	mutable std::mutex mutex_;
	std::deque<MatchmakingEntry> waiting_;
};
