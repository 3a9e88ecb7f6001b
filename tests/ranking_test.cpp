#include "services/ranking_service.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <limits>
#include <map>
#include <vector>

using namespace tourney;

namespace {

auto find_row(const ranking_summary &summary, type::team_id team) -> const seeding_ranking &
{
	auto it = std::ranges::find(summary.rankings, team, &seeding_ranking::team);
	REQUIRE(it != summary.rankings.end());
	return *it;
}

} // namespace

TEST_CASE("seed average uses the two best scores", "[ranking]")
{
	const auto summary = ranking_service::calculate({{1, {80.0, 100.0, 90.0}}});
	const auto &r = find_row(summary, 1);
	CHECK(*r.seed_average == Approx(95.0));
	CHECK(*r.tiebreaker_value == Approx(80.0));
	CHECK(r.seed_rank == 1);
}

TEST_CASE("tiebreaker falls back to the sum with two scores", "[ranking]")
{
	const auto summary = ranking_service::calculate({{1, {100.0, 90.0}}});
	CHECK(*find_row(summary, 1).tiebreaker_value == Approx(190.0));
}

TEST_CASE("a single score is both average and tiebreaker", "[ranking]")
{
	const auto summary = ranking_service::calculate({{1, {42.0}}});
	CHECK(*find_row(summary, 1).seed_average == Approx(42.0));
	CHECK(*find_row(summary, 1).tiebreaker_value == Approx(42.0));
}

TEST_CASE("equal averages are broken by the tiebreaker", "[ranking]")
{
	// A: 100, 90 -> average 95, tiebreaker 190
	// B: 100, 90, 80 -> average 95, tiebreaker 80
	// C: no scores
	const auto summary = ranking_service::calculate({{1, {100.0, 90.0}}, {2, {100.0, 90.0, 80.0}}, {3, {}}});

	CHECK(summary.teams_ranked == 2);
	CHECK(summary.teams_unranked == 1);
	REQUIRE(summary.rankings.size() == 3);

	CHECK(summary.rankings[0].team == 1);
	CHECK(summary.rankings[0].seed_rank == 1);
	CHECK(summary.rankings[1].team == 2);
	CHECK(summary.rankings[1].seed_rank == 2);

	const auto &c = summary.rankings[2];
	CHECK(c.team == 3);
	CHECK_FALSE(c.is_ranked());
	CHECK_FALSE(c.seed_average.has_value());
	CHECK_FALSE(c.raw_seed_score.has_value());

	CHECK(*summary.rankings[0].raw_seed_score == Approx(1.0));
	CHECK(*summary.rankings[1].raw_seed_score == Approx(0.625));
}

TEST_CASE("higher average ranks first regardless of score count", "[ranking]")
{
	const auto summary = ranking_service::calculate({{1, {10.0, 20.0, 30.0}}, {2, {40.0}}});
	CHECK(summary.rankings[0].team == 2);
	CHECK(summary.rankings[1].team == 1);

	// rank 2 of 2 with average 25 of a best 40
	CHECK(*summary.rankings[1].raw_seed_score == Approx(0.75 * 0.5 + 0.25 * (25.0 / 40.0)));
}

TEST_CASE("full ties keep team id order", "[ranking]")
{
	const auto summary = ranking_service::calculate({{9, {50.0, 50.0}}, {4, {50.0, 50.0}}, {7, {50.0, 50.0}}});
	CHECK(summary.rankings[0].team == 4);
	CHECK(summary.rankings[1].team == 7);
	CHECK(summary.rankings[2].team == 9);
	CHECK(summary.rankings[2].seed_rank == 3);
}

TEST_CASE("a best average of zero does not divide by zero", "[ranking]")
{
	const auto summary = ranking_service::calculate({{1, {0.0}}, {2, {0.0}}});
	CHECK(*summary.rankings[0].raw_seed_score == Approx(0.75));
	CHECK(*summary.rankings[1].raw_seed_score == Approx(0.375));
}

TEST_CASE("non-finite scores are ignored", "[ranking]")
{
	const double nan = std::numeric_limits<double>::quiet_NaN();
	const double inf = std::numeric_limits<double>::infinity();
	const auto summary = ranking_service::calculate({{1, {nan, 50.0}}, {2, {inf}}});

	CHECK(*find_row(summary, 1).seed_average == Approx(50.0));
	CHECK_FALSE(find_row(summary, 2).is_ranked());
	CHECK(summary.teams_ranked == 1);
	CHECK(summary.teams_unranked == 1);
}

TEST_CASE("ranked plus unranked covers every team", "[ranking]")
{
	std::map<type::team_id, std::vector<double>> table;
	for (type::team_id id = 1; id <= 20; ++id) {
		if (id % 3 == 0) {
			table[id];
		}
		else {
			table[id] = {static_cast<double>(id), static_cast<double>(id * 2)};
		}
	}

	const auto summary = ranking_service::calculate(table);
	CHECK(summary.teams_ranked + summary.teams_unranked == table.size());
	CHECK(summary.rankings.size() == table.size());

	for (std::size_t i = 0; i < summary.teams_ranked; ++i) {
		CHECK(summary.rankings[i].seed_rank == static_cast<int>(i) + 1);
		CHECK(*summary.rankings[i].raw_seed_score > 0.0);
		CHECK(*summary.rankings[i].raw_seed_score <= 1.0);
	}
}

TEST_CASE("no teams gives an empty summary", "[ranking]")
{
	const auto summary = ranking_service::calculate({});
	CHECK(summary.rankings.empty());
	CHECK(summary.teams_ranked == 0);
	CHECK(summary.teams_unranked == 0);
}
