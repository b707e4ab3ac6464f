// File: CombatRng.hpp
// Description: Random source used by battles and loot rolls, plus random ids.
#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

// Uniform draws in [0, 1). Abstract so tests can script the sequence.
class CombatRng {
public:
	virtual ~CombatRng() = default;
	virtual double roll() = 0;

	// Uniform index in [0, count). count must be > 0.
	std::size_t pick(std::size_t count);
};

// std::mt19937 seeded from libsodium. Shared by every session, so it locks.
class MersenneRng : public CombatRng {
public:
	MersenneRng();
	explicit MersenneRng(std::uint32_t seed);

	double roll() override;

private:
	std::mutex mutex_;
	std::mt19937 gen_;
	std::uniform_real_distribution<double> dist_{ 0.0, 1.0 };
};

// Hex id from libsodium's CSPRNG, used for DB rows and battle ids.
std::string random_hex_id(std::size_t bytes = 12);
