// File: PveBattle.hpp
// Description: One player against a scripted opponent.
#pragma once
#include "BattleSession.hpp"

class PveBattle : public BattleSession
{
public:
	PveBattle(net::io_context& ioc, BattleServices services,
		const std::shared_ptr<PlayerChannel>& channel,
		CombatantState player, CombatantState opponent);

	BattleKind kind() const override { return BattleKind::PVE; }
	std::vector<std::string> participants() const override { return { userId_ }; }

	void start() override;
	ActionResult submitAction(const std::string& actorId, BattleAction action) override;
	void handleDisconnect(const std::string& connectionId) override;
	std::optional<CombatantState> combatant(const std::string& combatantId) const override;

private:
	std::vector<std::weak_ptr<PlayerChannel>> channels() const override { return { channel_ }; }
	bool playerTurnOpen() const;
	void emitUpdate(const std::string& line, nlohmann::json extra = nlohmann::json::object());
	void resolveOpponentTurn();
	void concludeLocked(bool playerWon);

	std::weak_ptr<PlayerChannel> channel_;
	const std::string userId_;
	const std::string connectionId_;
	CombatantState player_;
	CombatantState opponent_;
};
