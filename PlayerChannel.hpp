// File: PlayerChannel.hpp
// Description: The outbound side of one client connection, as seen by the
// battle and matchmaking code.
#pragma once
#include <string>

class PlayerChannel {
public:
	virtual ~PlayerChannel() = default;

	virtual const std::string& connectionId() const = 0;
	virtual const std::string& userId() const = 0;

	// False once the socket closed; queued entries holding it are stale.
	virtual bool isOpen() const = 0;

	// Non-blocking. Messages to one channel arrive in call order.
	virtual void send(std::string message) = 0;
};
