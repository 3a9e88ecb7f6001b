#pragma once

#include "core/utils.hpp"
#include "models/game.hpp"
#include "services/resolution_service.hpp"

#include <optional>
#include <vector>

namespace tourney {

// A team written into a destination slot by an advancement.
struct slot_update {
	type::game_number game{};
	slot target{slot::team1};
	type::team_id team{};

	[[nodiscard]] auto operator==(const slot_update &) const -> bool = default;
};

struct advance_options {
	bool force{false}; // re-decide a completed game
	std::optional<int> team1_score{};
	std::optional<int> team2_score{};
};

struct advance_result {
	std::vector<game> games;
	std::vector<slot_update> updates;
	resolution_stats resolution;
	bool reset_required{}; // losers-bracket representative won the grand final
};

class advancement_service {
public:
	/**
	 * @brief Record a game result and move its teams along the advancement edges.
	 * @param games Current snapshot of the bracket; returned updated on success.
	 * @param number Game being decided.
	 * @param winner Must be one of the game's two teams.
	 * @param loser Optional; when given it must be the other team.
	 * @return The new snapshot plus the destination writes. On error the input is untouched.
	 */
	[[nodiscard]] static auto advance(std::vector<game> games, type::game_number number, type::team_id winner, std::optional<type::team_id> loser = std::nullopt,
																		advance_options options = {}) -> type::result<advance_result>;

private:
	// Undo the destination writes of a completed game before re-deciding it
	[[nodiscard]] static auto retract(std::vector<game> &games, const game &decided) -> type::result<type::ok_t>;
};

} // namespace tourney
