// File: GameErrors.hpp
// Description: Exceptions thrown by the stores and game services. Handlers
// catch these at the session boundary and answer with SERVER:ERROR.
#pragma once
#include <stdexcept>
#include <string>

class GameError : public std::runtime_error {
public:
	explicit GameError(const std::string& message) : std::runtime_error(message) {}
};

// A purchase was attempted with fewer coins than it costs. Nothing was changed.
class InsufficientFunds : public GameError {
public:
	InsufficientFunds(int required, int available)
		: GameError("Not enough coins! You need " + std::to_string(required) + " coins.")
		, required_(required), available_(available) {}

	int required() const { return required_; }
	int available() const { return available_; }

private:
	int required_;
	int available_;
};

// The store could not confirm a read or write. Safe to retry.
class PersistenceFailure : public GameError {
public:
	explicit PersistenceFailure(const std::string& message) : GameError(message) {}
};

class NotFound : public GameError {
public:
	explicit NotFound(const std::string& message) : GameError(message) {}
};

// The request was well formed but the rules forbid it (e.g. not enough stat points).
class RuleViolation : public GameError {
public:
	explicit RuleViolation(const std::string& message) : GameError(message) {}
};
