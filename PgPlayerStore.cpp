// File: PgPlayerStore.cpp
#include "PgPlayerStore.hpp"
#include "CombatRng.hpp"
#include "GameData.hpp"
#include "GameErrors.hpp"
#include <iostream>

namespace {

// Runs one store operation and turns libpqxx failures into PersistenceFailure.
// Game errors (NotFound, InsufficientFunds...) pass through untouched.
template<typename F>
auto translate_errors(const char* operation, F&& f) -> decltype(f())
{
	try {
		return f();
	}
	catch (const GameError&) {
		throw;
	}
	catch (const pqxx::failure& e) {
		std::cerr << "[DB ERROR] " << operation << ": " << e.what() << std::endl;
		throw PersistenceFailure(std::string("Database error during ") + operation + ".");
	}
}

Rarity rarity_from_row(const pqxx::field& field)
{
	const std::string key = field.as<std::string>();
	if (auto rarity = parse_rarity(key))
		return *rarity;
	// Legacy tiers (EPICO) no longer on the ladder
	std::cerr << "[DB] Unknown rarity '" << key << "', treating as " << rarity_info(Rarity::COMMON).key << std::endl;
	return Rarity::COMMON;
}

ProgressionRecord progression_from_row(const pqxx::row& row)
{
	ProgressionRecord p;
	p.level = row["level"].as<int>();
	p.xp = row["xp"].as<int>();
	p.xpToNextLevel = row["xpToNextLevel"].as<int>();
	p.statPoints = row["statPoints"].as<int>();
	p.strength = row["strength"].as<int>();
	p.vitality = row["vitality"].as<int>();
	return p;
}

// Locks the user's row for the rest of the transaction. Throws NotFound.
int lock_coins(pqxx::work& W, const std::string& userId)
{
	pqxx::result R = W.exec(pqxx::zview(
		"SELECT coins FROM \"User\" WHERE id = $1 FOR UPDATE"),
		pqxx::params(userId));
	if (R.empty())
		throw NotFound("Player not found.");
	return R[0]["coins"].as<int>();
}

void charge(pqxx::work& W, const std::string& userId, int cost)
{
	const int coins = lock_coins(W, userId);
	if (coins < cost)
		throw InsufficientFunds(cost, coins);
	W.exec(pqxx::zview("UPDATE \"User\" SET coins = coins - $2, \"updatedAt\" = NOW() WHERE id = $1"),
		pqxx::params(userId, cost));
}

ProgressionRecord lock_progression(pqxx::work& W, const std::string& userId)
{
	pqxx::result R = W.exec(pqxx::zview(
		"SELECT level, xp, \"xpToNextLevel\", \"statPoints\", strength, vitality "
		"FROM \"User\" WHERE id = $1 FOR UPDATE"),
		pqxx::params(userId));
	if (R.empty())
		throw NotFound("Player not found.");
	return progression_from_row(R[0]);
}

void write_progression(pqxx::work& W, const std::string& userId, const ProgressionRecord& record)
{
	W.exec(pqxx::zview(
		"UPDATE \"User\" SET level = $2, xp = $3, \"xpToNextLevel\" = $4, \"statPoints\" = $5, "
		"strength = $6, vitality = $7, \"updatedAt\" = NOW() WHERE id = $1"),
		pqxx::params(userId, record.level, record.xp, record.xpToNextLevel,
			record.statPoints, record.strength, record.vitality));
}

} // namespace

PgPlayerStore::PgPlayerStore(std::shared_ptr<DatabaseManager> db)
	: db_(std::move(db))
{
}

std::optional<std::string> PgPlayerStore::resolveSession(const std::string& sid)
{
	return translate_errors("resolveSession", [&]() -> std::optional<std::string> {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview(
			"SELECT sess->'user'->>'id' AS user_id FROM \"session\" WHERE sid = $1 AND expire > NOW()"),
			pqxx::params(sid));

		if (R.empty() || R[0]["user_id"].is_null())
			return std::nullopt;
		return R[0]["user_id"].as<std::string>();
		});
}

PlayerLoadout PgPlayerStore::loadLoadout(const std::string& userId)
{
	return translate_errors("loadLoadout", [&] {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);

		pqxx::result R = N.exec(pqxx::zview(
			"SELECT id, username, coins, level, xp, \"xpToNextLevel\", \"statPoints\", strength, vitality "
			"FROM \"User\" WHERE id = $1"),
			pqxx::params(userId));
		if (R.empty())
			throw NotFound("Player not found.");

		PlayerLoadout loadout;
		loadout.profile.userId = R[0]["id"].as<std::string>();
		loadout.profile.username = R[0]["username"].as<std::string>();
		loadout.profile.coins = R[0]["coins"].as<int>();
		loadout.profile.progression = progression_from_row(R[0]);

		pqxx::result chars = N.exec(pqxx::zview(
			"SELECT id, name, ability, rarity::text AS rarity FROM \"Character\" "
			"WHERE \"ownerId\" = $1 ORDER BY \"createdAt\", id"),
			pqxx::params(userId));
		for (const auto& row : chars) {
			OwnedCharacter c;
			c.id = row["id"].as<std::string>();
			c.name = row["name"].as<std::string>();
			c.ability = row["ability"].as<std::string>();
			c.rarity = rarity_from_row(row["rarity"]);
			loadout.characters.push_back(std::move(c));
		}

		pqxx::result swords = N.exec(pqxx::zview(
			"SELECT id, name, description, \"attackBonus\", rarity::text AS rarity FROM \"Sword\" "
			"WHERE \"ownerId\" = $1 ORDER BY \"createdAt\", id"),
			pqxx::params(userId));
		for (const auto& row : swords) {
			OwnedWeapon w;
			w.id = row["id"].as<std::string>();
			w.name = row["name"].as<std::string>();
			w.description = row["description"].as<std::string>();
			w.attackBonus = row["attackBonus"].as<int>();
			w.rarity = rarity_from_row(row["rarity"]);
			loadout.weapons.push_back(std::move(w));
		}

		return loadout;
		});
}

int PgPlayerStore::adjustCoins(const std::string& userId, int delta)
{
	return translate_errors("adjustCoins", [&] {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		pqxx::result R = W.exec(pqxx::zview(
			"UPDATE \"User\" SET coins = GREATEST(coins + $2, 0), \"updatedAt\" = NOW() "
			"WHERE id = $1 RETURNING coins"),
			pqxx::params(userId, delta));
		if (R.empty())
			throw NotFound("Player not found.");
		W.commit();
		return R[0]["coins"].as<int>();
		});
}

ProgressionRecord PgPlayerStore::modifyProgression(const std::string& userId,
	const std::function<void(ProgressionRecord&)>& mutate)
{
	return translate_errors("modifyProgression", [&] {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		ProgressionRecord record = lock_progression(W, userId);
		mutate(record); // throwing here rolls the transaction back
		write_progression(W, userId, record);
		W.commit();
		return record;
		});
}

std::pair<int, ProgressionRecord> PgPlayerStore::applyRewards(const std::string& userId, int coinDelta,
	const std::function<void(ProgressionRecord&)>& mutate)
{
	return translate_errors("applyRewards", [&] {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		ProgressionRecord record = lock_progression(W, userId);
		mutate(record);
		write_progression(W, userId, record);

		pqxx::result R = W.exec(pqxx::zview(
			"UPDATE \"User\" SET coins = GREATEST(coins + $2, 0) WHERE id = $1 RETURNING coins"),
			pqxx::params(userId, coinDelta));
		W.commit();
		return std::make_pair(R[0]["coins"].as<int>(), record);
		});
}

OwnedCharacter PgPlayerStore::purchaseCharacter(const std::string& userId, int cost, const CharacterTemplate& tmpl)
{
	return translate_errors("purchaseCharacter", [&] {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		charge(W, userId, cost);

		OwnedCharacter owned;
		owned.id = random_hex_id();
		owned.name = tmpl.name;
		owned.ability = tmpl.ability;
		owned.rarity = tmpl.rarity;

		W.exec(pqxx::zview(
			"INSERT INTO \"Character\" (id, name, ability, rarity, attack, health, \"buffDescription\", \"ownerId\") "
			"VALUES ($1, $2, $3, $4::\"Rarity\", $5, $6, $7, $8)"),
			pqxx::params(owned.id, tmpl.name, tmpl.ability, rarity_info(tmpl.rarity).key,
				tmpl.attack, tmpl.health, tmpl.buffDescription, userId));
		W.commit();
		return owned;
		});
}

OwnedWeapon PgPlayerStore::purchaseWeapon(const std::string& userId, int cost, const WeaponTemplate& tmpl)
{
	return translate_errors("purchaseWeapon", [&] {
		pqxx::connection C = db_->get_connection();
		pqxx::work W(C);
		charge(W, userId, cost);

		OwnedWeapon owned;
		owned.id = random_hex_id();
		owned.name = tmpl.name;
		owned.description = tmpl.description;
		owned.attackBonus = tmpl.attackBonus;
		owned.rarity = tmpl.rarity;

		W.exec(pqxx::zview(
			"INSERT INTO \"Sword\" (id, name, description, \"attackBonus\", rarity, \"ownerId\") "
			"VALUES ($1, $2, $3, $4, $5::\"Rarity\", $6)"),
			pqxx::params(owned.id, tmpl.name, tmpl.description, tmpl.attackBonus,
				rarity_info(tmpl.rarity).key, userId));
		W.commit();
		return owned;
		});
}

bool PgPlayerStore::ownsRarity(const std::string& userId, Rarity rarity)
{
	return translate_errors("ownsRarity", [&] {
		pqxx::connection C = db_->get_connection();
		pqxx::nontransaction N(C);
		pqxx::result R = N.exec(pqxx::zview(
			"SELECT 1 FROM \"Character\" WHERE \"ownerId\" = $1 AND rarity = $2::\"Rarity\" LIMIT 1"),
			pqxx::params(userId, rarity_info(rarity).key));
		return !R.empty();
		});
}
