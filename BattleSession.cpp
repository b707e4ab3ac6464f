// File: BattleSession.cpp
#include "BattleSession.hpp"
#include "Progression.hpp"
#include <boost/asio/bind_executor.hpp>
#include <iostream>

const char* to_string(ActionResult result) {
	switch (result) {
	case ActionResult::APPLIED: return "APPLIED";
	case ActionResult::REJECTED: return "REJECTED";
	case ActionResult::NOT_ELIGIBLE: return "NOT_ELIGIBLE";
	case ActionResult::STALE: return "STALE";
	}
	return "UNKNOWN";
}

BattleSession::BattleSession(net::io_context& ioc, BattleServices services)
	: services_(std::move(services))
	, id_(random_hex_id())
	, strand_(net::make_strand(ioc))
	, timer_(strand_)
{
}

BattlePhase BattleSession::phase() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return phase_;
}

bool BattleSession::isFinished() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return finished_;
}

bool BattleSession::isLocked() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return locked_;
}

std::vector<std::string> BattleSession::log() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return log_;
}

void BattleSession::setFinishedHandler(FinishedHandler handler) {
	std::lock_guard<std::mutex> lock(mutex_);
	onFinished_ = std::move(handler);
}

void BattleSession::scheduleLocked(std::chrono::milliseconds delay, std::function<void()> task)
{
	locked_ = true;
	timer_.expires_after(delay);
	timer_.async_wait(net::bind_executor(strand_,
		[self = shared_from_this(), task = std::move(task)](const boost::system::error_code& ec)
		{
			if (ec == net::error::operation_aborted)
				return;

			std::lock_guard<std::mutex> lock(self->mutex_);
			if (self->finished_)
				return;
			self->locked_ = false;
			try
			{
				task();
			}
			catch (const std::exception& e)
			{
				// No request to answer; end the battle rather than leave it locked forever.
				std::cerr << "[BATTLE ERROR] " << self->id_ << ": " << e.what() << std::endl;
				for (const auto& channel : self->channels())
				{
					sendTo(channel, "BATTLE_END", nlohmann::json{
						{"aborted", true},
						{"settled", false},
						{"message", "The battle was interrupted by a server error."}
						});
				}
				self->markFinished();
			}
		}));
}

void BattleSession::markFinished()
{
	if (finished_) return;
	finished_ = true;
	locked_ = false;
	phase_ = BattlePhase::FINISHED;
	timer_.cancel();
	if (onFinished_)
		onFinished_(id_);
}

void BattleSession::appendLog(const std::string& line) {
	log_.push_back(line);
}

void BattleSession::sendTo(const std::weak_ptr<PlayerChannel>& channel, const std::string& type)
{
	if (auto ch = channel.lock())
		ch->send("SERVER:" + type);
}

void BattleSession::sendTo(const std::weak_ptr<PlayerChannel>& channel, const std::string& type, const nlohmann::json& payload)
{
	if (auto ch = channel.lock())
		ch->send("SERVER:" + type + ":" + payload.dump());
}

void BattleSession::settle(std::weak_ptr<PlayerChannel> channel, const std::string& userId,
	int coinDelta, int xp, nlohmann::json endPayload)
{
	auto store = services_.store;
	const int statPointsPerLevel = services_.rules.statPointsPerLevel;
	const std::string battleId = id_;

	endPayload["coinsChange"] = coinDelta;
	endPayload["xpGained"] = xp;

	auto task = [store, channel, userId, coinDelta, xp, statPointsPerLevel, battleId, endPayload]() mutable
	{
		std::vector<int> levelsReached;
		bool settled = true;
		try
		{
			if (xp > 0)
			{
				ExperienceGrant grant = grant_battle_rewards(*store, userId, coinDelta, xp, statPointsPerLevel);
				levelsReached = grant.levelsReached;
				endPayload["progression"] = grant.record;
				if (coinDelta != 0)
					endPayload["balance"] = grant.balance;
			}
			else if (coinDelta != 0)
				endPayload["balance"] = store->adjustCoins(userId, coinDelta);
		}
		catch (const std::exception& e)
		{
			std::cerr << "[DB ERROR] Settlement of battle " << battleId << " for " << userId
				<< " failed: " << e.what() << std::endl;
			settled = false;
		}
		endPayload["settled"] = settled;

		auto ch = channel.lock();
		if (!ch) return;

		if (settled && xp > 0)
			ch->send("SERVER:NOTIFICATION:+" + std::to_string(xp) + " XP!");
		for (int level : levelsReached)
			ch->send("SERVER:NOTIFICATION:You reached level " + std::to_string(level) + "!");
		ch->send("SERVER:BATTLE_END:" + endPayload.dump());
		if (!settled)
			ch->send("SERVER:ERROR:Your battle rewards could not be saved. Please try again later.");
	};

	try
	{
		services_.dbPool->enqueue(std::move(task));
	}
	catch (const std::exception& e)
	{
		// Pool already stopped: the server is shutting down.
		std::cerr << "[DB ERROR] Could not queue settlement of battle " << battleId << ": " << e.what() << std::endl;
	}
}
