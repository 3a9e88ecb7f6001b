#pragma once

#include "core/utils.hpp"
#include "models/seeding.hpp"

#include <map>
#include <vector>

namespace tourney {

class ranking_service {
public:
	/**
	 * @brief Rank every team from its seeding scores.
	 *   - seed average: mean of the two best scores (the score itself with one score)
	 *   - tiebreaker: third-best score, else the sum of all scores (the score itself with one score)
	 *   - order: average desc, tiebreaker desc, then team id; teams without scores are unranked
	 *   - raw seed score: 0.75 * (N - rank + 1) / N + 0.25 * average / best average
	 * Teams with an empty score list are included as unranked.
	 */
	[[nodiscard]] static auto calculate(const std::map<type::team_id, std::vector<double>> &team_scores) -> ranking_summary;
};

} // namespace tourney
