#include "services/instantiation_service.hpp"
#include "services/template_service.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

using namespace tourney;
using namespace tourney::testing;

TEST_CASE("a full field makes every first-round game ready", "[instantiation]")
{
	for (int size : {4, 8, 16, 32, 64}) {
		INFO("size " << size);
		const auto templates = must(template_service::build(size));
		const auto entries = must(instantiation_service::entries_from_ranking(team_ids(size), size));
		const auto games = must(instantiation_service::instantiate(templates, entries));

		REQUIRE(games.size() == templates.size());
		CHECK(std::ranges::count_if(games, [](const game &g) { return g.status == game_status::ready; }) == size / 2);
		CHECK(std::ranges::count_if(games, [](const game &g) { return g.status == game_status::bye; }) == 0);
	}
}

TEST_CASE("seed slots receive the entered teams", "[instantiation]")
{
	const auto templates = must(template_service::build(8));
	const auto entries = must(instantiation_service::entries_from_ranking(std::vector<type::team_id>{101, 102, 103, 104, 105, 106, 107, 108}, 8));
	const auto games = must(instantiation_service::instantiate(templates, entries));

	// 1 v 8, 4 v 5, 2 v 7, 3 v 6
	CHECK(at(games, 1).team1 == 101);
	CHECK(at(games, 1).team2 == 108);
	CHECK(at(games, 2).team1 == 104);
	CHECK(at(games, 2).team2 == 105);
	CHECK(at(games, 3).team1 == 102);
	CHECK(at(games, 4).team2 == 106);

	// later rounds start empty
	CHECK_FALSE(at(games, 5).team1.has_value());
	CHECK(at(games, 5).status == game_status::pending);
}

TEST_CASE("an empty seed gives its opponent a bye", "[instantiation]")
{
	const auto templates = must(template_service::build(4));
	const auto entries = must(instantiation_service::entries_from_ranking(std::vector<type::team_id>{11, 12, 13}, 4));
	REQUIRE(entries.size() == 4);
	CHECK(entries[3].is_bye);

	const auto games = must(instantiation_service::instantiate(templates, entries));
	const auto &g1 = at(games, 1);
	CHECK(g1.status == game_status::bye);
	CHECK(g1.winner == 11);
	CHECK_FALSE(g1.loser.has_value());
	CHECK(at(games, 2).status == game_status::ready);
}

TEST_CASE("missing seed positions count as byes", "[instantiation]")
{
	const auto templates = must(template_service::build(4));
	const std::vector<entry> entries{entry::with_team(1, 7), entry::with_team(2, 8), entry::with_team(3, 9)};
	const auto games = must(instantiation_service::instantiate(templates, entries));
	CHECK(at(games, 1).status == game_status::bye);
	CHECK(at(games, 1).winner == 7);
}

TEST_CASE("invalid entry sets are rejected", "[instantiation]")
{
	SECTION("seed outside the bracket")
	{
		const std::vector<entry> entries{entry::with_team(1, 1), entry::with_team(5, 2)};
		CHECK(error_of(instantiation_service::validate_entries(entries, 4)) == type::errc::invalid_entry);
	}
	SECTION("seed position used twice")
	{
		const std::vector<entry> entries{entry::with_team(1, 1), entry::with_team(1, 2), entry::with_team(2, 3)};
		CHECK(error_of(instantiation_service::validate_entries(entries, 4)) == type::errc::invalid_entry);
	}
	SECTION("team entered twice")
	{
		const std::vector<entry> entries{entry::with_team(1, 1), entry::with_team(2, 1), entry::with_team(3, 3)};
		CHECK(error_of(instantiation_service::validate_entries(entries, 4)) == type::errc::invalid_entry);
	}
	SECTION("bye carrying a team")
	{
		const std::vector<entry> entries{entry{.seed_position = 1, .team = 4, .is_bye = true}, entry::with_team(2, 5)};
		CHECK(error_of(instantiation_service::validate_entries(entries, 4)) == type::errc::invalid_entry);
	}
	SECTION("two byes in one first-round game")
	{
		// 8 slots pair 4 v 5, both empty with only two teams
		CHECK(error_of(instantiation_service::entries_from_ranking(team_ids(2), 8)) == type::errc::invalid_entry);
	}
	SECTION("more teams than seats")
	{
		CHECK(error_of(instantiation_service::entries_from_ranking(team_ids(5), 4)) == type::errc::invalid_entry);
	}
	SECTION("unsupported bracket size")
	{
		CHECK(error_of(instantiation_service::validate_entries({}, 6)) == type::errc::unsupported_size);
	}
}

TEST_CASE("instantiating an empty template fails", "[instantiation]")
{
	CHECK(error_of(instantiation_service::instantiate({}, {})) == type::errc::invalid_state);
}
