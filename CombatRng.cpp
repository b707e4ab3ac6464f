// File: CombatRng.cpp
#include "CombatRng.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace {

void ensure_sodium()
{
	// Returns 1 when already initialized, which is fine.
	if (sodium_init() < 0)
		throw std::runtime_error("Libsodium failed to initialize!");
}

} // namespace

std::size_t CombatRng::pick(std::size_t count)
{
	if (count == 0)
		throw std::invalid_argument("pick from an empty pool");
	auto index = static_cast<std::size_t>(roll() * static_cast<double>(count));
	return index < count ? index : count - 1;
}

MersenneRng::MersenneRng()
{
	ensure_sodium();
	gen_.seed(randombytes_random());
}

MersenneRng::MersenneRng(std::uint32_t seed)
	: gen_(seed)
{
}

double MersenneRng::roll()
{
	std::lock_guard<std::mutex> lock(mutex_);
	return dist_(gen_);
}

std::string random_hex_id(std::size_t bytes)
{
	ensure_sodium();
	std::vector<unsigned char> raw(bytes);
	randombytes_buf(raw.data(), raw.size());

	std::string hex(bytes * 2 + 1, '\0');
	sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
	hex.pop_back(); // trailing NUL
	return hex;
}
