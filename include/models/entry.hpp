#pragma once

#include "core/utils.hpp"
#include "models/json_fields.hpp"
#include <nlohmann/json.hpp>

#include <optional>

namespace tourney {

// A seed position in a bracket, holding either a team or a declared bye.
class entry {
public:
	int seed_position{};
	std::optional<type::team_id> team;
	bool is_bye{};

	[[nodiscard]] static auto with_team(int seed, type::team_id id) -> entry { return {.seed_position = seed, .team = id, .is_bye = false}; }
	[[nodiscard]] static auto bye(int seed) -> entry { return {.seed_position = seed, .team = std::nullopt, .is_bye = true}; }

	// is_bye <=> no team
	[[nodiscard]] auto well_formed() const noexcept -> bool { return is_bye != team.has_value(); }

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		return {{"seed_position", seed_position}, {"team_id", detail::optional_to_json(team)}, {"is_bye", is_bye}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> entry
	{
		return {.seed_position = j.at("seed_position").get<int>(),
						.team = detail::optional_from_json<type::team_id>(j, "team_id"),
						.is_bye = j.value("is_bye", false)};
	}
};

} // namespace tourney
