#include "services/advancement_service.hpp"
#include "test_helpers.hpp"

#include <catch2/catch.hpp>

using namespace tourney;
using namespace tourney::testing;

namespace {

// Four full seeds: game 1 is 1 v 4, game 2 is 2 v 3
auto four_team_bracket() -> std::vector<game> { return seeded_games(4, 4); }

auto play(std::vector<game> games, type::game_number number, type::team_id winner, advance_options options = {}) -> std::vector<game>
{
	return must(advancement_service::advance(std::move(games), number, winner, std::nullopt, options)).games;
}

// Plays to the grand final: 1 wins the winners bracket, 3 comes through the losers bracket
auto to_grand_final() -> std::vector<game>
{
	auto games = four_team_bracket();
	games = play(std::move(games), 1, 1);
	games = play(std::move(games), 2, 2);
	games = play(std::move(games), 3, 1);
	games = play(std::move(games), 4, 3);
	games = play(std::move(games), 5, 3);
	return games;
}

} // namespace

TEST_CASE("advancing moves the winner and the loser along their edges", "[advancement]")
{
	const auto res = must(advancement_service::advance(four_team_bracket(), 1, 1));

	const auto &g1 = at(res.games, 1);
	CHECK(g1.status == game_status::completed);
	CHECK(g1.winner == 1);
	CHECK(g1.loser == 4);

	REQUIRE(res.updates.size() == 2);
	CHECK(res.updates[0] == slot_update{.game = 3, .target = slot::team1, .team = 1});
	CHECK(res.updates[1] == slot_update{.game = 4, .target = slot::team1, .team = 4});
	CHECK_FALSE(res.reset_required);

	CHECK(at(res.games, 3).team1 == 1);
	CHECK(at(res.games, 4).team1 == 4);
}

TEST_CASE("a destination with both teams becomes ready", "[advancement]")
{
	auto games = play(four_team_bracket(), 1, 1);
	games = play(std::move(games), 2, 3);

	CHECK(at(games, 3).status == game_status::ready);
	CHECK(at(games, 3).team2 == 3);
	CHECK(at(games, 4).status == game_status::ready);
	CHECK(at(games, 4).team2 == 2);
}

TEST_CASE("scores are stored with the result", "[advancement]")
{
	const auto games = play(four_team_bracket(), 2, 3, advance_options{.team1_score = 10, .team2_score = 21});
	CHECK(at(games, 2).team1_score == 10);
	CHECK(at(games, 2).team2_score == 21);
}

TEST_CASE("advancement errors", "[advancement]")
{
	auto games = four_team_bracket();

	SECTION("unknown game")
	{
		CHECK(error_of(advancement_service::advance(games, 42, 1)) == type::errc::game_not_found);
	}
	SECTION("winner not in the game")
	{
		CHECK(error_of(advancement_service::advance(games, 1, 2)) == type::errc::invalid_winner);
	}
	SECTION("loser is not the opponent")
	{
		CHECK(error_of(advancement_service::advance(games, 1, 1, type::team_id{3})) == type::errc::invalid_winner);
		CHECK(must(advancement_service::advance(games, 1, 1, type::team_id{4})).games.front().loser == 4);
	}
	SECTION("game without both teams")
	{
		CHECK(error_of(advancement_service::advance(games, 3, 1)) == type::errc::game_not_ready);
	}
	SECTION("game already completed")
	{
		games = play(std::move(games), 1, 1);
		CHECK(error_of(advancement_service::advance(games, 1, 1)) == type::errc::already_completed);
		CHECK(error_of(advancement_service::advance(games, 1, 4)) == type::errc::already_completed);
	}
	SECTION("bye game")
	{
		const auto sparse = seeded_games(4, 3);
		CHECK(error_of(advancement_service::advance(sparse, 1, 1)) == type::errc::already_completed);
	}
}

TEST_CASE("winners-bracket champion takes the grand final", "[advancement][grand_final]")
{
	auto games = to_grand_final();
	const auto &gf = at(games, 6);
	REQUIRE(gf.status == game_status::ready);
	REQUIRE(gf.team1 == 1);
	REQUIRE(gf.team2 == 3);

	const auto res = must(advancement_service::advance(games, 6, 1));
	CHECK_FALSE(res.reset_required);

	// only the winner edge is written
	REQUIRE(res.updates.size() == 1);
	CHECK(res.updates[0].game == 7);

	const auto &reset = at(res.games, 7);
	CHECK(reset.status == game_status::bye);
	CHECK(reset.winner == 1);
	CHECK_FALSE(reset.team1.has_value());
}

TEST_CASE("losers-bracket champion forces the reset game", "[advancement][grand_final]")
{
	const auto res = must(advancement_service::advance(to_grand_final(), 6, 3));
	CHECK(res.reset_required);

	const auto &reset = at(res.games, 7);
	CHECK(reset.status == game_status::ready);
	CHECK(reset.team1 == 1);
	CHECK(reset.team2 == 3);

	const auto done = must(advancement_service::advance(res.games, 7, 1));
	CHECK(at(done.games, 7).winner == 1);
	CHECK(done.updates.empty());
	CHECK_FALSE(done.reset_required);
}

TEST_CASE("forced override re-routes an undecided result", "[advancement][force]")
{
	auto games = play(four_team_bracket(), 1, 1);

	SECTION("without force the result stands")
	{
		CHECK(error_of(advancement_service::advance(games, 1, 4)) == type::errc::already_completed);
	}

	SECTION("force swaps the teams downstream")
	{
		games = play(std::move(games), 1, 4, advance_options{.force = true});
		CHECK(at(games, 1).winner == 4);
		CHECK(at(games, 3).team1 == 4);
		CHECK(at(games, 4).team1 == 1);
	}

	SECTION("force is refused once a downstream game is decided")
	{
		games = play(std::move(games), 2, 2);
		games = play(std::move(games), 3, 1);
		CHECK(error_of(advancement_service::advance(games, 1, 4, std::nullopt, advance_options{.force = true})) == type::errc::already_completed);
	}
}

TEST_CASE("forced grand final override reopens an auto-resolved reset", "[advancement][force][grand_final]")
{
	auto games = play(to_grand_final(), 6, 1);
	REQUIRE(at(games, 7).status == game_status::bye);

	const auto res = must(advancement_service::advance(games, 6, 3, std::nullopt, advance_options{.force = true}));
	CHECK(res.reset_required);

	const auto &reset = at(res.games, 7);
	CHECK(reset.status == game_status::ready);
	CHECK(reset.team1 == 1);
	CHECK(reset.team2 == 3);
	CHECK_FALSE(reset.winner.has_value());
}

TEST_CASE("a loser dropped opposite an impossible slot advances by bye", "[advancement]")
{
	// 3 teams: game 4 is fed by the loser of bye game 1 and the loser of game 2
	auto games = seeded_games(4, 3);
	const auto res = must(advancement_service::advance(games, 2, 2));

	CHECK(at(res.games, 4).status == game_status::bye);
	CHECK(at(res.games, 4).winner == 3);
	CHECK(at(res.games, 5).team1 == 3);
	CHECK(res.resolution.byes_resolved == 1);
	CHECK(at(res.games, 3).status == game_status::ready);
}
