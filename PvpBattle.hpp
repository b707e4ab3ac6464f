// File: PvpBattle.hpp
// Description: Two connected players taking strict turns. Each side gets
// every update from its own point of view.
#pragma once
#include "BattleSession.hpp"
#include <array>

class PvpBattle : public BattleSession
{
public:
	struct Side {
		CombatantState state;
		std::string connectionId;
		std::weak_ptr<PlayerChannel> channel;
	};

	// first acts first.
	PvpBattle(net::io_context& ioc, BattleServices services, Side first, Side second);

	BattleKind kind() const override { return BattleKind::PVP; }
	std::vector<std::string> participants() const override { return { userIds_[0], userIds_[1] }; }

	void start() override;
	ActionResult submitAction(const std::string& actorId, BattleAction action) override;
	void handleDisconnect(const std::string& connectionId) override;
	std::optional<CombatantState> combatant(const std::string& combatantId) const override;

	// User id expected to act next.
	std::string currentTurn() const;

private:
	std::vector<std::weak_ptr<PlayerChannel>> channels() const override { return { sides_[0].channel, sides_[1].channel }; }
	int sideOf(const std::string& userId) const;
	bool turnOpenFor(int side) const;
	void emitStateTo(int side, const std::string& line, nlohmann::json extra = nlohmann::json::object());
	void emitBoth(const std::string& line, nlohmann::json extra = nlohmann::json::object());
	void castAwakening(int side);
	void concludeLocked(int winner, bool forfeit);

	const std::array<std::string, 2> userIds_;
	std::array<Side, 2> sides_;
	int turn_ = 0;
};
