// File: PlayerStore.hpp
// Description: Abstract access to accounts, inventories and web sessions.
// Every method is blocking; call it from the db pool, never an Asio thread.
#pragma once
#include "game_session.hpp"
#include "Items.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>

class PlayerStore {
public:
	virtual ~PlayerStore() = default;

	// Maps a web session id to its user id, if the session exists and has not expired.
	virtual std::optional<std::string> resolveSession(const std::string& sid) = 0;

	// Profile, owned characters and weapons. Throws NotFound for unknown users.
	virtual PlayerLoadout loadLoadout(const std::string& userId) = 0;

	// Adds delta to the balance, never going below zero. Returns the new balance.
	virtual int adjustCoins(const std::string& userId, int delta) = 0;

	/**
	 * @brief Read-modify-write of the progression fields as one transaction.
	 * @param mutate Runs with the row locked; throwing aborts without writing.
	 * @return The record as written.
	 */
	virtual ProgressionRecord modifyProgression(const std::string& userId,
		const std::function<void(ProgressionRecord&)>& mutate) = 0;

	/**
	 * @brief Coin delta (floored at zero) and progression change in one transaction.
	 * @param mutate Runs with the row locked; throwing aborts both writes.
	 * @return The new balance and the record as written.
	 */
	virtual std::pair<int, ProgressionRecord> applyRewards(const std::string& userId, int coinDelta,
		const std::function<void(ProgressionRecord&)>& mutate) = 0;

	// Deducts cost and inserts the item in one transaction.
	// Throws InsufficientFunds (nothing written) when the balance is short.
	virtual OwnedCharacter purchaseCharacter(const std::string& userId, int cost, const CharacterTemplate& tmpl) = 0;
	virtual OwnedWeapon purchaseWeapon(const std::string& userId, int cost, const WeaponTemplate& tmpl) = 0;

	virtual bool ownsRarity(const std::string& userId, Rarity rarity) = 0;
};
