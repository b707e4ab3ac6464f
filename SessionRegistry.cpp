// File: SessionRegistry.cpp
#include "SessionRegistry.hpp"

bool SessionRegistry::claim(const std::shared_ptr<BattleSession>& session)
{
	const std::vector<std::string> users = session->participants();

	std::lock_guard<std::mutex> lock(mutex_);
	for (const auto& user : users)
		if (sessionByUser_.count(user))
			return false;

	sessions_[session->id()] = session;
	for (const auto& user : users)
		sessionByUser_[user] = session->id();
	return true;
}

void SessionRegistry::release(const std::string& sessionId)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = sessions_.find(sessionId);
	if (it == sessions_.end())
		return;

	for (auto u = sessionByUser_.begin(); u != sessionByUser_.end();)
	{
		if (u->second == sessionId)
			u = sessionByUser_.erase(u);
		else
			++u;
	}
	sessions_.erase(it);
}

std::shared_ptr<BattleSession> SessionRegistry::findById(const std::string& sessionId) const
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = sessions_.find(sessionId);
	return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<BattleSession> SessionRegistry::findByUser(const std::string& userId) const
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto u = sessionByUser_.find(userId);
	if (u == sessionByUser_.end())
		return nullptr;
	auto it = sessions_.find(u->second);
	return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::isBusy(const std::string& userId) const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return sessionByUser_.count(userId) > 0;
}

std::size_t SessionRegistry::activeCount() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return sessions_.size();
}
