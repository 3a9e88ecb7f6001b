#pragma once

#include "core/utils.hpp"
#include "models/entry.hpp"
#include "models/game.hpp"
#include "models/game_template.hpp"

#include <span>
#include <vector>

namespace tourney {

class instantiation_service {
public:
	// Reject entry sets that break the entry invariants: seed out of 1..size, duplicate seed or team,
	// bye/team mismatch, or two byes paired in the same first-round game.
	[[nodiscard]] static auto validate_entries(std::span<const entry> entries, int bracket_size) -> type::result<type::ok_t>;

	// Ranked teams take seeds 1..n in order, the remaining seed positions become byes.
	[[nodiscard]] static auto entries_from_ranking(std::span<const type::team_id> ranked_teams, int bracket_size) -> type::result<std::vector<entry>>;

	// Concrete games with seed slots resolved. Missing seed positions count as byes.
	[[nodiscard]] static auto instantiate(std::span<const game_template> templates, std::span<const entry> entries) -> type::result<std::vector<game>>;
};

} // namespace tourney
