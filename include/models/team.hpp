#pragma once

#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <compare>
#include <string>

namespace tourney {

class team {
public:
	type::team_id id{};
	int number{};
	std::string name;

	// defaulted three-way comparison
	[[nodiscard]] auto operator<=>(const team &) const = default;

	[[nodiscard]] auto to_json() const -> nlohmann::json { return {{"team_id", id}, {"team_number", number}, {"team_name", name}}; }

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> team
	{
		return {.id = j.at("team_id").get<type::team_id>(), .number = j.value("team_number", 0), .name = j.value("team_name", std::string{})};
	}

	[[nodiscard]] auto label() const -> std::string { return name.empty() ? std::to_string(number) : std::to_string(number) + " " + name; }
};

} // namespace tourney
