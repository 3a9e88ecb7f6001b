#pragma once

#include "core/utils.hpp"
#include "models/game.hpp"

#include <vector>

namespace tourney {

struct resolution_stats {
	int byes_resolved{};
	int slots_filled{};
	int games_readied{};
	int passes{};

	auto operator+=(const resolution_stats &o) -> resolution_stats &
	{
		byes_resolved += o.byes_resolved;
		slots_filled += o.slots_filled;
		games_readied += o.games_readied;
		passes += o.passes;
		return *this;
	}
};

struct resolution {
	std::vector<game> games;
	resolution_stats stats;
};

/**
 * @brief
 * Propagates byes and decided winners forward until nothing changes.
 *   - a slot fed by the winner of a decided game is filled with that winner
 *   - a game with one team whose other slot can never be filled becomes a bye
 *     won by that team; two such slots make an empty bye that passes the gap on
 *   - a pending game with both teams becomes ready
 * Losers are never written here; a bye has no loser, so a slot fed by the
 * loser of a bye can never be filled.
 */
class resolution_service {
public:
	// Idempotent. Fails with cycle_detected if the source graph is not acyclic.
	[[nodiscard]] static auto resolve(std::vector<game> games) -> type::result<resolution>;

	// Kahn's algorithm over the source references
	[[nodiscard]] static auto check_acyclic(const std::vector<game> &games) -> type::result<type::ok_t>;
};

} // namespace tourney
