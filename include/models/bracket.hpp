#pragma once

#include "core/utils.hpp"
#include "models/entry.hpp"
#include "models/game.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tourney {

enum class bracket_status { setup, in_progress, completed };

[[nodiscard]] constexpr auto to_string(bracket_status s) noexcept -> std::string_view
{
	switch (s) {
	case bracket_status::setup:
		return "setup";
	case bracket_status::in_progress:
		return "in_progress";
	case bracket_status::completed:
		return "completed";
	}
	return "setup";
}

[[nodiscard]] inline auto bracket_status_from_string(std::string_view s) -> std::optional<bracket_status>
{
	if (s == "setup")
		return bracket_status::setup;
	if (s == "in_progress")
		return bracket_status::in_progress;
	if (s == "completed")
		return bracket_status::completed;
	return std::nullopt;
}

class bracket {
public:
	std::string name;
	int bracket_size{};
	int actual_team_count{};
	bracket_status status{bracket_status::setup};
	std::vector<entry> entries;
	std::vector<game> games;

	[[nodiscard]] auto find_game(type::game_number number) const -> const game *
	{
		auto it = std::ranges::find(games, number, &game::number);
		return it == games.end() ? nullptr : &*it;
	}

	// The reset game's winner once it is decided (played, or resolved as a bye).
	[[nodiscard]] auto champion() const -> std::optional<type::team_id>
	{
		auto it = std::ranges::find_if(games, &game::is_reset_game);
		if (it == games.end() || !it->is_decided()) {
			return std::nullopt;
		}
		return it->winner;
	}

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		nlohmann::json out;
		out["name"] = name;
		out["bracket_size"] = bracket_size;
		out["actual_team_count"] = actual_team_count;
		out["status"] = tourney::to_string(status);
		out["entries"] = nlohmann::json::array();
		for (const auto &e : entries) {
			out["entries"].push_back(e.to_json());
		}
		out["games"] = nlohmann::json::array();
		for (const auto &g : games) {
			out["games"].push_back(g.to_json());
		}
		return out;
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> bracket
	{
		bracket b;
		b.name = j.at("name").get<std::string>();
		b.bracket_size = j.at("bracket_size").get<int>();
		b.actual_team_count = j.value("actual_team_count", 0);

		const auto parsed_status = bracket_status_from_string(j.value("status", std::string{"setup"}));
		if (!parsed_status) {
			throw std::invalid_argument("invalid bracket status");
		}
		b.status = *parsed_status;

		if (j.contains("entries")) {
			for (const auto &ej : j.at("entries")) {
				b.entries.push_back(entry::from_json(ej));
			}
		}
		if (j.contains("games")) {
			for (const auto &gj : j.at("games")) {
				b.games.push_back(game::from_json(gj));
			}
		}
		return b;
	}
};

} // namespace tourney
