#include "core/constants.hpp"
#include "services/ranking_service.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <numeric>

namespace tourney {

namespace {

// Descending with absent values last
auto before(const std::optional<double> &a, const std::optional<double> &b) -> std::optional<bool>
{
	if (!a && !b)
		return std::nullopt;
	if (!a)
		return false;
	if (!b)
		return true;
	if (*a != *b)
		return *a > *b;
	return std::nullopt;
}

} // namespace

auto ranking_service::calculate(const std::map<type::team_id, std::vector<double>> &team_scores) -> ranking_summary
{
	std::vector<seeding_ranking> rows;
	rows.reserve(team_scores.size());

	for (const auto &[team, recorded] : team_scores) {
		std::vector<double> scores;
		std::ranges::copy_if(recorded, std::back_inserter(scores), [](double s) { return std::isfinite(s); });
		std::ranges::sort(scores, std::greater<>{});

		seeding_ranking r{.team = team};
		if (scores.size() >= 2) {
			r.seed_average = (scores[0] + scores[1]) / 2.0;
			r.tiebreaker_value = scores.size() >= 3 ? scores[2] : std::accumulate(scores.begin(), scores.end(), 0.0);
		}
		else if (scores.size() == 1) {
			r.seed_average = scores[0];
			r.tiebreaker_value = scores[0];
		}
		rows.push_back(std::move(r));
	}

	// Stable: equal rows keep team id order
	std::ranges::stable_sort(rows, [](const seeding_ranking &a, const seeding_ranking &b) {
		if (auto by_average = before(a.seed_average, b.seed_average)) {
			return *by_average;
		}
		return before(a.tiebreaker_value, b.tiebreaker_value).value_or(false);
	});

	const auto ranked = static_cast<std::size_t>(std::ranges::count_if(rows, [](const seeding_ranking &r) { return r.seed_average.has_value(); }));
	const double n = static_cast<double>(ranked);

	// Ranked rows sort first, so the best average is the first row's
	double best_average = ranked > 0 ? *rows.front().seed_average : 1.0;
	if (best_average == 0.0) {
		best_average = 1.0;
	}

	for (std::size_t i = 0; i < ranked; ++i) {
		auto &r = rows[i];
		const int rank = util::narrow_cast<int>(i) + 1;
		r.seed_rank = rank;
		r.raw_seed_score =
				constants::seeding::rank_weight * ((n - rank + 1) / n) + constants::seeding::average_weight * (*r.seed_average / best_average);
	}

	return ranking_summary{.rankings = std::move(rows), .teams_ranked = ranked, .teams_unranked = team_scores.size() - ranked};
}

} // namespace tourney
