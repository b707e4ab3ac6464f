// File: GameData.cpp
// Description: Defines the static catalogs. Names and DB keys must match the
// rows already stored in the Character and Sword tables.
#include "GameData.hpp"
#include <stdexcept>

const std::vector<RarityInfo> RARITY_LADDER = {
	{ Rarity::COMMON,     "COMUM",        "Comum",        "#9e9e9e", 0.60 },
	{ Rarity::RARE,       "RARO",         "Raro",         "#42a5f5", 0.25 },
	{ Rarity::LEGENDARY,  "LENDARIO",     "Lendário",     "#ab47bc", 0.10 },
	{ Rarity::MYTHIC,     "MITICO",       "Mítico",       "#ff7043", 0.045 },
	{ Rarity::ULTRA_RARE, "CHATYNIRARES", "Chatynirares", "#ffee58", 0.005 },
	{ Rarity::SUPREME,    "SUPREME",      "Supreme",      "#f1c40f", 0.0 } // exclusive, never rolled
};

const std::string SUPREME_CHARACTER_NAME = "The Overlord";

const std::map<Rarity, std::vector<CharacterTemplate>> CHARACTERS_BY_RARITY = {
	{ Rarity::COMMON, {
		{ "Guerreiro de Taverna", "Golpe Básico", Rarity::COMMON, 0, 0, "+5 de Vida", HealthFlatBuff{ 5 } },
		{ "Mago Aprendiz", "Faísca Mágica", Rarity::COMMON, 0, 0, "+1% de Ataque", AttackPercentBuff{ 0.01 } },
		{ "Ladino de Beco", "Ataque Furtivo Simples", Rarity::COMMON, 0, 0, "+1% de Defesa", DefensePercentBuff{ 0.01 } }
	} },
	{ Rarity::RARE, {
		{ "Cavaleiro de Aço", "Investida Poderosa", Rarity::RARE, 0, 0, "+3% de Defesa", DefensePercentBuff{ 0.03 } },
		{ "Feiticeiro Elemental", "Bola de Fogo", Rarity::RARE, 0, 0, "+3% de Ataque", AttackPercentBuff{ 0.03 } },
		{ "Arqueiro Élfico", "Flecha Precisa", Rarity::RARE, 0, 0, "+20 de Vida", HealthFlatBuff{ 20 } }
	} },
	{ Rarity::LEGENDARY, {
		{ "Paladino da Luz Solar", "Cura Divina", Rarity::LEGENDARY, 0, 0, "+10% de Defesa", DefensePercentBuff{ 0.10 } },
		{ "Arquimago do Tempo", "Parar o Tempo (1s)", Rarity::LEGENDARY, 0, 0, "+100 de Vida", HealthFlatBuff{ 100 } },
		{ "Mestre das Sombras", "Invisibilidade", Rarity::LEGENDARY, 0, 0, "+8% de Ataque", AttackPercentBuff{ 0.08 } }
	} },
	{ Rarity::MYTHIC, {
		{ "Avatar do Dragão", "Sopro de Fogo em Cone", Rarity::MYTHIC, 0, 0, "+15% de Ataque", AttackPercentBuff{ 0.15 } },
		{ "Portador da Lâmina Cósmica", "Golpe Meteoro", Rarity::MYTHIC, 0, 0, "+500 de Vida", HealthFlatBuff{ 500 } }
	} },
	{ Rarity::ULTRA_RARE, {
		{ "Deus da Forja Estelar", "Criar Realidade", Rarity::ULTRA_RARE, 0, 0, "+25% de Ataque e Defesa", AllPercentBuff{ 0.25 } }
	} },
	{ Rarity::SUPREME, {
		{ "The Overlord", "Absolute Power", Rarity::SUPREME, 999999, 9999999,
			"Imune a todos os efeitos negativos. Causa dano letal.", AttackFlatBuff{ 999999 } }
	} }
};

// Gift-only characters. Never part of a roll.
const std::map<std::string, CharacterTemplate> EXCLUSIVE_CHARACTERS = {
	{ "RATO MAROMBA", { "RATO MAROMBA", "Pump de Biceps", Rarity::SUPREME, 500, 10000,
		"+20% de Ataque e +200 de Vida", MixedBuff{ 0.20, 200 } } },
	{ "Jacket", { "Jacket", "Combo Violento", Rarity::SUPREME, 300, 3500,
		"Desfere um combo devastador de 300 golpes.", AttackFlatBuff{ 300 } } }
};

// No weapons exist above LEGENDARY yet.
const std::map<Rarity, std::vector<WeaponTemplate>> WEAPONS_BY_RARITY = {
	{ Rarity::COMMON, {
		{ "Adaga Enferrujada", "Melhor que nada.", 5, Rarity::COMMON },
		{ "Espada Curta", "Uma espada curta e confiável.", 8, Rarity::COMMON }
	} },
	{ Rarity::RARE, {
		{ "Cimitarra de Aço", "Uma lâmina curva e afiada.", 15, Rarity::RARE },
		{ "Machado de Batalha", "Pesado e intimidador.", 20, Rarity::RARE }
	} },
	{ Rarity::LEGENDARY, {
		{ "Lâmina Vorpal", "Corta com precisão mortal.", 40, Rarity::LEGENDARY }
	} }
};

const std::vector<OpponentTemplate> OPPONENTS = {
	{ "Goblin Sorrateiro", 80, 60 },
	{ "Orc Brutamontes", 120, 150 },
	{ "Feiticeira do Pântano", 150, 90 },
	{ "Cavaleiro Caído", 200, 200 },
	{ "Lich Ancestral", 280, 180 },
	{ "Dragão Vermelho Jovem", 350, 400 }
};

const std::map<std::string, AwakeningDefinition> AWAKENINGS = {
	{ "Jacket", { "Jacket", "Combo Violento", 300, false,
		{ "Do you know...", "what time it is?", "...It's time to hurt other people." },
		"/audio/jacket-theme.mp3" } },
	{ "The Overlord", { "The Overlord", "Aniquilação", 0, true,
		{ "Você enfrentou o dono do site...", "Corajoso, ein?" },
		"/audio/overlord-theme.mp3" } },
	{ "RATO MAROMBA", { "RATO MAROMBA", "FIBRA ABSOLUTA", 10000, false,
		{ "EAE, MERMÃO...", "MEXEU COM O RATO ERRADO...", "VOU TE ESMAGAR!" },
		"/audio/rato-maromba-theme.mp3" } }
};

const RarityInfo& rarity_info(Rarity rarity) {
	for (const auto& info : RARITY_LADDER) {
		if (info.rarity == rarity) return info;
	}
	throw std::out_of_range("Unknown rarity");
}

std::optional<Rarity> parse_rarity(const std::string& key) {
	for (const auto& info : RARITY_LADDER) {
		if (info.key == key) return info.rarity;
	}
	return std::nullopt;
}

int rarity_rank(Rarity rarity) {
	return static_cast<int>(rarity);
}

const CharacterTemplate* find_character_template(const std::string& name) {
	auto ex = EXCLUSIVE_CHARACTERS.find(name);
	if (ex != EXCLUSIVE_CHARACTERS.end()) return &ex->second;

	for (const auto& [rarity, pool] : CHARACTERS_BY_RARITY) {
		for (const auto& tmpl : pool) {
			if (tmpl.name == name) return &tmpl;
		}
	}
	return nullptr;
}

const AwakeningDefinition* find_awakening(const std::string& character) {
	auto it = AWAKENINGS.find(character);
	return it != AWAKENINGS.end() ? &it->second : nullptr;
}
