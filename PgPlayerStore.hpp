// File: PgPlayerStore.hpp
// Description: PlayerStore over the web tier's PostgreSQL schema
// ("User", "Character", "Sword", session). See sql/schema.sql.
#pragma once
#include "PlayerStore.hpp"
#include "DatabaseManager.hpp"
#include <memory>

class PgPlayerStore : public PlayerStore {
public:
	explicit PgPlayerStore(std::shared_ptr<DatabaseManager> db);

	std::optional<std::string> resolveSession(const std::string& sid) override;
	PlayerLoadout loadLoadout(const std::string& userId) override;
	int adjustCoins(const std::string& userId, int delta) override;
	ProgressionRecord modifyProgression(const std::string& userId,
		const std::function<void(ProgressionRecord&)>& mutate) override;
	std::pair<int, ProgressionRecord> applyRewards(const std::string& userId, int coinDelta,
		const std::function<void(ProgressionRecord&)>& mutate) override;
	OwnedCharacter purchaseCharacter(const std::string& userId, int cost, const CharacterTemplate& tmpl) override;
	OwnedWeapon purchaseWeapon(const std::string& userId, int cost, const WeaponTemplate& tmpl) override;
	bool ownsRarity(const std::string& userId, Rarity rarity) override;

private:
	std::shared_ptr<DatabaseManager> db_;
};
