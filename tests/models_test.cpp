#include "models/bracket.hpp"
#include "models/game_template.hpp"
#include "services/advancement_service.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

using namespace tourney;
using namespace tourney::testing;

TEST_CASE("slot sources have a canonical text form", "[models]")
{
	CHECK(slot_source::seed(3).to_string() == "seed:3");
	CHECK(slot_source::winner_of(12).to_string() == "winner:12");
	CHECK(slot_source::loser_of(7).to_string() == "loser:7");

	CHECK(slot_source::parse("seed:16") == slot_source::seed(16));
	CHECK(slot_source::parse("winner:5") == slot_source::winner_of(5));
	CHECK(slot_source::parse("loser:1") == slot_source::loser_of(1));
}

TEST_CASE("malformed slot sources do not parse", "[models]")
{
	for (const char *text : {"", "seed", "seed:", "seed:0", "seed:-1", "seed:1x", "champion:1", "winner 5", ":3"}) {
		INFO("text '" << text << "'");
		CHECK_FALSE(slot_source::parse(text).has_value());
	}
}

TEST_CASE("a played game survives a JSON round trip", "[models]")
{
	auto games = seeded_games(4, 4);
	games = must(advancement_service::advance(std::move(games), 1, 1, std::nullopt, advance_options{.team1_score = 3, .team2_score = 1})).games;

	for (const auto &g : games) {
		INFO("game " << g.number);
		CHECK(game::from_json(g.to_json()) == g);
	}

	const auto j = at(games, 1).to_json();
	CHECK(j.at("status").get<std::string>() == "completed");
	CHECK(j.at("team1_source").get<std::string>() == "seed:1");
	CHECK(j.at("winner_advances_to").at("game").get<int>() == 3);
	CHECK(j.at("loser_advances_to").at("slot").get<std::string>() == "team1");
	CHECK(j.at("team1_score").get<int>() == 3);
	CHECK(at(games, 6).to_json().at("winner_id").is_null());
}

TEST_CASE("bracket JSON keeps entries, games and status", "[models]")
{
	bracket b;
	b.name = "spring";
	b.bracket_size = 4;
	b.actual_team_count = 3;
	b.status = bracket_status::in_progress;
	b.entries = {entry::with_team(1, 11), entry::with_team(2, 12), entry::with_team(3, 13), entry::bye(4)};
	b.games = seeded_games(4, 3);

	const auto copy = bracket::from_json(b.to_json());
	CHECK(copy.name == b.name);
	CHECK(copy.bracket_size == 4);
	CHECK(copy.actual_team_count == 3);
	CHECK(copy.status == bracket_status::in_progress);
	REQUIRE(copy.entries.size() == 4);
	CHECK(copy.entries[3].is_bye);
	CHECK_FALSE(copy.entries[3].team.has_value());
	CHECK(copy.games == b.games);
}

TEST_CASE("bad enum text is rejected when loading", "[models]")
{
	auto j = seeded_games(4, 4).front().to_json();
	j["status"] = "finished";
	CHECK_THROWS_AS(game::from_json(j), std::invalid_argument);

	CHECK_FALSE(bracket_status_from_string("done").has_value());
	CHECK_FALSE(side_from_string("middle").has_value());
}

TEST_CASE("the champion is the decided reset game's winner", "[models]")
{
	bracket b;
	b.games = seeded_games(4, 4);
	CHECK_FALSE(b.champion().has_value());

	auto &reset = b.games.back();
	REQUIRE(reset.is_reset_game);
	reset.status = game_status::bye;
	reset.winner = 2;
	CHECK(b.champion() == 2);
}
