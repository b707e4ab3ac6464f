// File: SessionRegistry.hpp
// Description: Live battles by id and by participant. A user is in at most
// one battle at a time.
#pragma once
#include "BattleSession.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

class SessionRegistry {
public:
	/**
	 * @brief Registers the session for all of its participants at once.
	 * @return false, registering nothing, if any participant is already in a battle.
	 */
	bool claim(const std::shared_ptr<BattleSession>& session);

	// Drops the session and frees its participants. Unknown ids are ignored.
	void release(const std::string& sessionId);

	std::shared_ptr<BattleSession> findById(const std::string& sessionId) const;
	std::shared_ptr<BattleSession> findByUser(const std::string& userId) const;
	bool isBusy(const std::string& userId) const;
	std::size_t activeCount() const;

private:
	mutable std::mutex mutex_;
	std::map<std::string, std::shared_ptr<BattleSession>> sessions_;
	std::map<std::string, std::string> sessionByUser_;
};
