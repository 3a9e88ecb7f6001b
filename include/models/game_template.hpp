#pragma once

#include "core/utils.hpp"
#include "models/json_fields.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <stdexcept>
#include <optional>
#include <string>
#include <string_view>

namespace tourney {

enum class bracket_side { winners, losers, finals };

enum class slot { team1, team2 };

[[nodiscard]] constexpr auto to_string(bracket_side side) noexcept -> std::string_view
{
	switch (side) {
	case bracket_side::winners:
		return "winners";
	case bracket_side::losers:
		return "losers";
	case bracket_side::finals:
		return "finals";
	}
	return "winners";
}

[[nodiscard]] inline auto side_from_string(std::string_view s) -> std::optional<bracket_side>
{
	if (s == "winners")
		return bracket_side::winners;
	if (s == "losers")
		return bracket_side::losers;
	if (s == "finals")
		return bracket_side::finals;
	return std::nullopt;
}

[[nodiscard]] constexpr auto to_string(slot s) noexcept -> std::string_view { return s == slot::team1 ? "team1" : "team2"; }

[[nodiscard]] inline auto slot_from_string(std::string_view s) -> std::optional<slot>
{
	if (s == "team1")
		return slot::team1;
	if (s == "team2")
		return slot::team2;
	return std::nullopt;
}

[[nodiscard]] constexpr auto other(slot s) noexcept -> slot { return s == slot::team1 ? slot::team2 : slot::team1; }

// Where a game slot gets its team from: a seed position, or the winner/loser of an earlier game.
class slot_source {
public:
	enum class kind { seed, winner_of, loser_of };

	kind from{kind::seed};
	int ref{};

	[[nodiscard]] static constexpr auto seed(int position) noexcept -> slot_source { return {kind::seed, position}; }
	[[nodiscard]] static constexpr auto winner_of(type::game_number g) noexcept -> slot_source { return {kind::winner_of, g}; }
	[[nodiscard]] static constexpr auto loser_of(type::game_number g) noexcept -> slot_source { return {kind::loser_of, g}; }

	[[nodiscard]] constexpr auto is_seed() const noexcept -> bool { return from == kind::seed; }
	[[nodiscard]] constexpr auto references_game() const noexcept -> bool { return from != kind::seed; }

	[[nodiscard]] constexpr auto operator==(const slot_source &) const -> bool = default;

	// "seed:1", "winner:5", "loser:3"
	[[nodiscard]] auto to_string() const -> std::string
	{
		switch (from) {
		case kind::seed:
			return fmt::format("seed:{}", ref);
		case kind::winner_of:
			return fmt::format("winner:{}", ref);
		case kind::loser_of:
			return fmt::format("loser:{}", ref);
		}
		return {};
	}

	[[nodiscard]] static auto parse(std::string_view text) -> std::optional<slot_source>
	{
		const auto colon = text.find(':');
		if (colon == std::string_view::npos) {
			return std::nullopt;
		}

		const auto prefix = text.substr(0, colon);
		const auto digits = text.substr(colon + 1);

		int value{};
		const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
		if (ec != std::errc{} || ptr != digits.data() + digits.size() || value < 1) {
			return std::nullopt;
		}

		if (prefix == "seed")
			return seed(value);
		if (prefix == "winner")
			return winner_of(value);
		if (prefix == "loser")
			return loser_of(value);
		return std::nullopt;
	}
};

// Forward edge: the game and slot a winner (or loser) moves into.
struct advancement {
	type::game_number game{};
	slot target{slot::team1};

	[[nodiscard]] constexpr auto operator==(const advancement &) const -> bool = default;

	[[nodiscard]] auto to_json() const -> nlohmann::json { return {{"game", game}, {"slot", tourney::to_string(target)}}; }

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> advancement
	{
		const auto s = slot_from_string(j.at("slot").get<std::string>());
		if (!s) {
			throw std::invalid_argument("invalid slot name");
		}
		return {.game = j.at("game").get<type::game_number>(), .target = *s};
	}
};

[[nodiscard]] inline auto parse_source(const nlohmann::json &j) -> slot_source
{
	auto src = slot_source::parse(j.get<std::string>());
	if (!src) {
		throw std::invalid_argument("invalid slot source: " + j.get<std::string>());
	}
	return *src;
}

[[nodiscard]] inline auto optional_advancement(const nlohmann::json &j, const std::string &key) -> std::optional<advancement>
{
	const auto it = j.find(key);
	if (it == j.end() || it->is_null()) {
		return std::nullopt;
	}
	return advancement::from_json(*it);
}

class game_template {
public:
	int bracket_size{};
	type::game_number number{};
	std::string round_name;
	int round_number{};
	bracket_side side{bracket_side::winners};
	slot_source team1_source;
	slot_source team2_source;
	std::optional<advancement> winner_advances_to;
	std::optional<advancement> loser_advances_to;
	bool is_grand_final{};
	bool is_reset_game{};

	[[nodiscard]] auto source(slot s) const -> const slot_source & { return s == slot::team1 ? team1_source : team2_source; }

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		return {{"bracket_size", bracket_size},
						{"game_number", number},
						{"round_name", round_name},
						{"round_number", round_number},
						{"bracket_side", tourney::to_string(side)},
						{"team1_source", team1_source.to_string()},
						{"team2_source", team2_source.to_string()},
						{"winner_advances_to", winner_advances_to ? winner_advances_to->to_json() : nlohmann::json(nullptr)},
						{"loser_advances_to", loser_advances_to ? loser_advances_to->to_json() : nlohmann::json(nullptr)},
						{"is_grand_final", is_grand_final},
						{"is_reset_game", is_reset_game}};
	}
};

} // namespace tourney
