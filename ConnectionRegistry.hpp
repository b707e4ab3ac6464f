// File: ConnectionRegistry.hpp
// Description: Open connections by connection id, for shutdown broadcasts.
#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

template<typename Connection>
class ConnectionRegistry {
public:
	void add(const std::string& connectionId, const std::shared_ptr<Connection>& connection)
	{
		std::lock_guard<std::mutex> lock(mutex_);
		connections_[connectionId] = connection;
	}

	void remove(const std::string& connectionId)
	{
		std::lock_guard<std::mutex> lock(mutex_);
		connections_.erase(connectionId);
	}

	// Live connections at the time of the call.
	std::vector<std::shared_ptr<Connection>> snapshot() const
	{
		std::vector<std::shared_ptr<Connection>> live;
		std::lock_guard<std::mutex> lock(mutex_);
		for (auto const& [id, weak] : connections_)
			if (auto c = weak.lock())
				live.push_back(c);
		return live;
	}

	std::size_t size() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return connections_.size();
	}

private:
	mutable std::mutex mutex_;
	std::map<std::string, std::weak_ptr<Connection>> connections_;
};
