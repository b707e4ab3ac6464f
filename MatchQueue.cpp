// File: MatchQueue.cpp
#include "MatchQueue.hpp"
#include <algorithm>
#include <iostream>

bool MatchmakingEntry::isConnected() const
{
	auto ch = channel.lock();
	return ch && ch->isOpen();
}

EnqueueResult MatchQueue::enqueue(MatchmakingEntry entry)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto same_user = [&](const MatchmakingEntry& e) { return e.userId == entry.userId; };
	if (std::any_of(waiting_.begin(), waiting_.end(), same_user))
		return { EnqueueStatus::ALREADY_QUEUED, std::nullopt };

	std::cout << "[MATCHMAKING] " << entry.stats.name << " joined the queue" << std::endl;
	waiting_.push_back(std::move(entry));

	std::optional<MatchPairing> pairing = pairLocked();
	if (!pairing)
		return { EnqueueStatus::QUEUED, std::nullopt };
	return { EnqueueStatus::PAIRED, std::move(pairing) };
}

std::optional<MatchPairing> MatchQueue::tryPair()
{
	std::lock_guard<std::mutex> lock(mutex_);
	return pairLocked();
}

std::optional<MatchPairing> MatchQueue::pairLocked()
{
	if (waiting_.size() < 2)
		return std::nullopt;

	MatchmakingEntry first = std::move(waiting_.front());
	waiting_.pop_front();
	MatchmakingEntry second = std::move(waiting_.front());
	waiting_.pop_front();

	const bool firstOk = first.isConnected();
	const bool secondOk = second.isConnected();
	if (!firstOk || !secondOk)
	{
		if (secondOk) waiting_.push_front(std::move(second));
		if (firstOk) waiting_.push_front(std::move(first));
		std::cout << "[MATCHMAKING] Dropped a disconnected entry; pairing skipped" << std::endl;
		return std::nullopt;
	}

	std::cout << "[MATCHMAKING] Paired " << first.stats.name << " with " << second.stats.name << std::endl;
	return MatchPairing{ std::move(first), std::move(second) };
}

void MatchQueue::requeueFront(MatchmakingEntry entry)
{
	std::lock_guard<std::mutex> lock(mutex_);
	waiting_.push_front(std::move(entry));
}

bool MatchQueue::removeByConnection(const std::string& connectionId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = std::find_if(waiting_.begin(), waiting_.end(),
		[&](const MatchmakingEntry& e) { return e.connectionId == connectionId; });
	if (it == waiting_.end())
		return false;

	std::cout << "[MATCHMAKING] " << it->stats.name << " left the queue" << std::endl;
	waiting_.erase(it);
	return true;
}

std::size_t MatchQueue::size() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return waiting_.size();
}

std::vector<std::string> MatchQueue::waitingUsers() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<std::string> users;
	for (const auto& e : waiting_)
		users.push_back(e.userId);
	return users;
}
