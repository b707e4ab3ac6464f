// File: GameLogic.cpp
// Description: Implements the game command handlers for the AsyncSession class:
// message parsing, the authentication gate and the hand-off to the coordinator.
#include "AsyncSession.hpp"
#include "game_session.hpp"
#include <iostream>
#include <sstream>
#include <string>

using namespace std;

void AsyncSession::handle_message(const string& message)
{
	auto self = shared_from_this();

	// --- 1. AUTH COMMANDS (Allowed *before* login) ---
	if (message.rfind("AUTH:", 0) == 0) {
		handle_auth(message.substr(5));
		return;
	}

	// --- 2. AUTHENTICATION GATE ---
	if (!is_authenticated_) {
		send("SERVER:ERROR:You must be logged in to do that.");
		return;
	}

	// --- 3. GAME COMMANDS ---
	if (message == "GET_BUILD") {
		coordinator_->sendBuild(self);
	}
	else if (message == "START_BATTLE") {
		coordinator_->startPveBattle(self);
	}
	else if (message.rfind("BATTLE_ACTION:", 0) == 0) {
		handle_battle_action(message.substr(14));
	}
	else if (message == "FIND_MATCH") {
		coordinator_->enqueueForMatch(self);
	}
	else if (message == "ROLL_CHARACTER") {
		coordinator_->rollCharacter(self);
	}
	else if (message == "ROLL_WEAPON") {
		coordinator_->rollWeapon(self);
	}
	else if (message.rfind("ALLOCATE_STATS:", 0) == 0) {
		handle_allocate_stats(message.substr(15));
	}
	else {
		send("SERVER:ERROR:Unknown command.");
	}
}

void AsyncSession::handle_auth(const string& sid)
{
	if (is_authenticated_) {
		send("SERVER:ERROR:Already authenticated.");
		return;
	}
	if (sid.empty()) {
		send("SERVER:ERROR:Invalid session.");
		return;
	}
	if (auth_pending_.exchange(true)) {
		send("SERVER:ERROR:Authentication already in progress.");
		return;
	}

	auto self = shared_from_this();
	// The lookup runs on a DB thread; the result comes back on our strand.
	coordinator_->resolveAuth(sid, [self](std::optional<std::string> userId) {
		net::post(self->ws_.get_executor(), [self, userId] {
			self->on_auth_finished(userId);
			});
		});
}

void AsyncSession::on_auth_finished(const std::optional<std::string>& userId)
{
	auth_pending_ = false;
	if (!userId) {
		send("SERVER:ERROR:Session expired. Please log in again.");
		return;
	}

	user_id_ = *userId;
	is_authenticated_ = true;
	std::cout << "[" << client_address_ << "] Authenticated as " << user_id_ << "\n";
	send("SERVER:AUTH_OK");
}

void AsyncSession::handle_battle_action(const string& actionText)
{
	std::optional<BattleAction> action = parse_battle_action(actionText);
	if (!action) {
		send("SERVER:ERROR:Unknown battle action.");
		return;
	}
	coordinator_->submitPlayerAction(shared_from_this(), *action);
}

void AsyncSession::handle_allocate_stats(const string& args)
{
	// "<strength>:<vitality>"
	stringstream ss(args);
	string strText, vitText;
	int strength = 0, vitality = 0;
	try {
		if (!getline(ss, strText, ':') || !getline(ss, vitText))
			throw invalid_argument("missing field");
		strength = stoi(strText);
		vitality = stoi(vitText);
	}
	catch (const exception&) {
		send("SERVER:ERROR:Invalid stat allocation format.");
		return;
	}
	coordinator_->allocateStats(shared_from_this(), strength, vitality);
}
