#pragma once

#include "models/bracket.hpp"
#include "models/game_template.hpp"
#include "models/seeding.hpp"
#include "models/team.hpp"
#include "services/bracket_service.hpp"

#include <span>
#include <string>

namespace tourney::ui {

// Plain-text tables for the terminal
class text_builder {
public:
	[[nodiscard]] static auto build_help() -> std::string;

	[[nodiscard]] static auto build_template(std::span<const game_template> templates) -> std::string;

	[[nodiscard]] static auto build_team_list(std::span<const team> teams) -> std::string;

	[[nodiscard]] static auto build_rankings(const ranking_summary &summary, std::span<const team> teams) -> std::string;

	[[nodiscard]] static auto build_bracket(const bracket &b, std::span<const team> teams) -> std::string;

	[[nodiscard]] static auto build_bracket_list(std::span<const bracket> brackets) -> std::string;

	[[nodiscard]] static auto build_record(const bracket &b, type::game_number number, const record_outcome &outcome, std::span<const team> teams)
			-> std::string;

private:
	// "#3 Name" when registered, "team 17" otherwise
	[[nodiscard]] static auto team_label(type::team_id id, std::span<const team> teams) -> std::string;
	[[nodiscard]] static auto slot_label(const game &g, slot s, std::span<const team> teams) -> std::string;
};

} // namespace tourney::ui
