#pragma once

#include "core/utils.hpp"
#include "models/json_fields.hpp"
#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace tourney {

// One recorded seeding round score.
struct seeding_score {
	type::team_id team{};
	int round{};
	double score{};

	[[nodiscard]] auto to_json() const -> nlohmann::json { return {{"team_id", team}, {"round_number", round}, {"score", score}}; }

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> seeding_score
	{
		return {.team = j.at("team_id").get<type::team_id>(), .round = j.at("round_number").get<int>(), .score = j.at("score").get<double>()};
	}
};

class seeding_ranking {
public:
	type::team_id team{};
	std::optional<double> seed_average;
	std::optional<int> seed_rank;
	std::optional<double> tiebreaker_value;
	std::optional<double> raw_seed_score;

	[[nodiscard]] auto is_ranked() const noexcept -> bool { return seed_rank.has_value(); }

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		return {{"team_id", team},
						{"seed_average", detail::optional_to_json(seed_average)},
						{"seed_rank", detail::optional_to_json(seed_rank)},
						{"tiebreaker_value", detail::optional_to_json(tiebreaker_value)},
						{"raw_seed_score", detail::optional_to_json(raw_seed_score)}};
	}

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> seeding_ranking
	{
		return {.team = j.at("team_id").get<type::team_id>(),
						.seed_average = detail::optional_from_json<double>(j, "seed_average"),
						.seed_rank = detail::optional_from_json<int>(j, "seed_rank"),
						.tiebreaker_value = detail::optional_from_json<double>(j, "tiebreaker_value"),
						.raw_seed_score = detail::optional_from_json<double>(j, "raw_seed_score")};
	}
};

// Full recalculation output; ranked teams first in rank order, unranked after.
struct ranking_summary {
	std::vector<seeding_ranking> rankings;
	std::size_t teams_ranked{};
	std::size_t teams_unranked{};
};

} // namespace tourney
