// File: BuildCalculator.cpp
#include "BuildCalculator.hpp"
#include "GameData.hpp"
#include <cmath>
#include <sstream>
#include <variant>

namespace {

struct BuffTotals {
	double attackPercent = 0.0;
	double defensePercent = 0.0;
	int healthFlat = 0;
	int attackFlat = 0;
};

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void accumulate(BuffTotals& totals, const Buff& buff) {
	std::visit(overloaded{
		[](const NoBuff&) {},
		[&](const AttackPercentBuff& b) { totals.attackPercent += b.value; },
		[&](const DefensePercentBuff& b) { totals.defensePercent += b.value; },
		[&](const HealthFlatBuff& b) { totals.healthFlat += b.value; },
		[&](const AttackFlatBuff& b) { totals.attackFlat += b.value; },
		[&](const AllPercentBuff& b) {
			totals.attackPercent += b.value;
			totals.defensePercent += b.value;
		},
		[&](const MixedBuff& b) {
			totals.attackPercent += b.attackPercent;
			totals.healthFlat += b.healthFlat;
		}
	}, buff);
}

int template_health(const OwnedCharacter& c) {
	const CharacterTemplate* tmpl = find_character_template(c.name);
	return tmpl ? tmpl->health : 0;
}

int percent(double fraction) {
	return static_cast<int>(std::lround(fraction * 100.0));
}

} // namespace

PlayerBuild calculate_player_build(const ProgressionRecord& attributes,
	const std::vector<OwnedCharacter>& characters,
	const std::vector<OwnedWeapon>& weapons)
{
	PlayerBuild build;
	build.basePower = 10 + attributes.strength * 2;
	build.baseHealth = 50 + attributes.vitality * 10;

	BuffTotals totals;

	if (!characters.empty()) {
		// Highest template health wins, first one kept on ties
		const OwnedCharacter* main = &characters.front();
		int mainHealth = template_health(*main);
		for (const auto& c : characters) {
			int health = template_health(c);
			if (health > mainHealth) {
				main = &c;
				mainHealth = health;
			}
		}
		build.flatBonusCollectible = *main;

		if (const CharacterTemplate* tmpl = find_character_template(main->name)) {
			totals.attackFlat += tmpl->attack;
			totals.healthFlat += tmpl->health;
		}

		for (const auto& c : characters) {
			if (const CharacterTemplate* tmpl = find_character_template(c.name))
				accumulate(totals, tmpl->buff);
		}

		// Highest rarity rank wins, first one kept on ties
		const OwnedCharacter* gate = &characters.front();
		for (const auto& c : characters) {
			if (rarity_rank(c.rarity) > rarity_rank(gate->rarity))
				gate = &c;
		}
		build.dominantCollectible = *gate;
	}

	for (const auto& w : weapons) {
		if (w.attackBonus > build.weaponBonus)
			build.weaponBonus = w.attackBonus;
	}

	build.flatAttackBonus = totals.attackFlat;
	build.flatHealthBonus = totals.healthFlat;
	build.attackPercentBonus = totals.attackPercent;
	build.defensePercentBonus = totals.defensePercent;

	// floor applied once, at the very end
	build.totalPower = static_cast<int>(std::floor(
		(build.basePower + build.flatAttackBonus) * (1.0 + build.attackPercentBonus) + build.weaponBonus));
	build.totalHealth = build.baseHealth + build.flatHealthBonus;
	build.buffSummary = describe_buffs(build);

	return build;
}

std::string describe_buffs(const PlayerBuild& build)
{
	std::ostringstream oss;
	bool first = true;
	auto add = [&](const std::string& part) {
		if (!first) oss << ", ";
		oss << part;
		first = false;
	};

	if (build.attackPercentBonus > 0)
		add("+" + std::to_string(percent(build.attackPercentBonus)) + "% de Ataque");
	if (build.defensePercentBonus > 0)
		add("+" + std::to_string(percent(build.defensePercentBonus)) + "% de Defesa");
	if (build.flatHealthBonus > 0)
		add("+" + std::to_string(build.flatHealthBonus) + " de Vida");
	if (build.weaponBonus > 0)
		add("+" + std::to_string(build.weaponBonus) + " de Ataque (Espada)");

	return first ? "Nenhum buff ativo" : oss.str();
}
