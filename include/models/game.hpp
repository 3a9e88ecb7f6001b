#pragma once

#include "core/utils.hpp"
#include "models/game_template.hpp"
#include "models/json_fields.hpp"
#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tourney {

enum class game_status { pending, ready, bye, completed };

[[nodiscard]] constexpr auto to_string(game_status s) noexcept -> std::string_view
{
	switch (s) {
	case game_status::pending:
		return "pending";
	case game_status::ready:
		return "ready";
	case game_status::bye:
		return "bye";
	case game_status::completed:
		return "completed";
	}
	return "pending";
}

[[nodiscard]] inline auto status_from_string(std::string_view s) -> std::optional<game_status>
{
	if (s == "pending")
		return game_status::pending;
	if (s == "ready")
		return game_status::ready;
	if (s == "bye")
		return game_status::bye;
	if (s == "completed")
		return game_status::completed;
	return std::nullopt;
}

// An instantiated bracket game. Structure is copied from its template;
// teams, status and result change only through resolution and advancement.
class game {
public:
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

	game_status status{game_status::pending};
	std::optional<type::team_id> team1;
	std::optional<type::team_id> team2;
	std::optional<type::team_id> winner;
	std::optional<type::team_id> loser;
	std::optional<int> team1_score;
	std::optional<int> team2_score;

	[[nodiscard]] static auto from_template(const game_template &t) -> game
	{
		game g;
		g.number = t.number;
		g.round_name = t.round_name;
		g.round_number = t.round_number;
		g.side = t.side;
		g.team1_source = t.team1_source;
		g.team2_source = t.team2_source;
		g.winner_advances_to = t.winner_advances_to;
		g.loser_advances_to = t.loser_advances_to;
		g.is_grand_final = t.is_grand_final;
		g.is_reset_game = t.is_reset_game;
		return g;
	}

	[[nodiscard]] auto source(slot s) const -> const slot_source & { return s == slot::team1 ? team1_source : team2_source; }
	[[nodiscard]] auto team(slot s) const -> const std::optional<type::team_id> & { return s == slot::team1 ? team1 : team2; }
	auto set_team(slot s, std::optional<type::team_id> id) -> void { (s == slot::team1 ? team1 : team2) = id; }

	[[nodiscard]] auto has_both_teams() const noexcept -> bool { return team1.has_value() && team2.has_value(); }

	// completed or resolved as a bye
	[[nodiscard]] auto is_decided() const noexcept -> bool { return status == game_status::completed || status == game_status::bye; }

	[[nodiscard]] auto involves(type::team_id id) const noexcept -> bool { return team1 == id || team2 == id; }

	[[nodiscard]] auto opponent_of(type::team_id id) const -> std::optional<type::team_id>
	{
		if (team1 == id)
			return team2;
		if (team2 == id)
			return team1;
		return std::nullopt;
	}

	[[nodiscard]] auto operator==(const game &) const -> bool = default;

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		return {{"game_number", number},
						{"round_name", round_name},
						{"round_number", round_number},
						{"bracket_side", tourney::to_string(side)},
						{"team1_source", team1_source.to_string()},
						{"team2_source", team2_source.to_string()},
						{"winner_advances_to", winner_advances_to ? winner_advances_to->to_json() : nlohmann::json(nullptr)},
						{"loser_advances_to", loser_advances_to ? loser_advances_to->to_json() : nlohmann::json(nullptr)},
						{"is_grand_final", is_grand_final},
						{"is_reset_game", is_reset_game},
						{"status", tourney::to_string(status)},
						{"team1_id", detail::optional_to_json(team1)},
						{"team2_id", detail::optional_to_json(team2)},
						{"winner_id", detail::optional_to_json(winner)},
						{"loser_id", detail::optional_to_json(loser)},
						{"team1_score", detail::optional_to_json(team1_score)},
						{"team2_score", detail::optional_to_json(team2_score)}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> game
	{
		game g;
		g.number = j.at("game_number").get<type::game_number>();
		g.round_name = j.value("round_name", std::string{});
		g.round_number = j.value("round_number", 0);

		const auto parsed_side = side_from_string(j.at("bracket_side").get<std::string>());
		const auto parsed_status = status_from_string(j.at("status").get<std::string>());
		if (!parsed_side || !parsed_status) {
			throw std::invalid_argument("invalid bracket_side or status");
		}
		g.side = *parsed_side;
		g.status = *parsed_status;

		g.team1_source = parse_source(j.at("team1_source"));
		g.team2_source = parse_source(j.at("team2_source"));
		g.winner_advances_to = optional_advancement(j, "winner_advances_to");
		g.loser_advances_to = optional_advancement(j, "loser_advances_to");
		g.is_grand_final = j.value("is_grand_final", false);
		g.is_reset_game = j.value("is_reset_game", false);

		g.team1 = detail::optional_from_json<type::team_id>(j, "team1_id");
		g.team2 = detail::optional_from_json<type::team_id>(j, "team2_id");
		g.winner = detail::optional_from_json<type::team_id>(j, "winner_id");
		g.loser = detail::optional_from_json<type::team_id>(j, "loser_id");
		g.team1_score = detail::optional_from_json<int>(j, "team1_score");
		g.team2_score = detail::optional_from_json<int>(j, "team2_score");
		return g;
	}
};

} // namespace tourney
