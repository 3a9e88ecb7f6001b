#include "services/advancement_service.hpp"
#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace tourney {

namespace {

auto find_game(std::vector<game> &games, type::game_number number) -> game *
{
	auto it = std::ranges::find(games, number, &game::number);
	return it == games.end() ? nullptr : &*it;
}

} // namespace

auto advancement_service::retract(std::vector<game> &games, const game &decided) -> type::result<type::ok_t>
{
	const std::pair<std::optional<advancement>, std::optional<type::team_id>> written[] = {{decided.winner_advances_to, decided.winner},
																																												 {decided.loser_advances_to, decided.loser}};

	for (const auto &[edge, team] : written) {
		if (!edge || !team) {
			continue;
		}

		auto *dest = find_game(games, edge->game);
		if (!dest) {
			continue;
		}

		// An auto-resolved reset game is the only decided destination that may be reopened
		const bool reopenable = dest->is_reset_game && dest->status == game_status::bye;
		if (dest->is_decided() && !reopenable) {
			return util::fail(type::errc::already_completed,
												fmt::format("cannot override game {}: game {} has already been decided", decided.number, dest->number));
		}

		if (dest->team(edge->target) == team) {
			dest->set_team(edge->target, std::nullopt);
		}
		dest->status = game_status::pending;
		dest->winner = std::nullopt;
		dest->loser = std::nullopt;
	}

	return type::ok_t{};
}

auto advancement_service::advance(std::vector<game> games, type::game_number number, type::team_id winner, std::optional<type::team_id> loser,
																	advance_options options) -> type::result<advance_result>
{
	auto *g = find_game(games, number);
	if (!g) {
		return util::fail(type::errc::game_not_found, fmt::format("game {} not found", number));
	}

	if (g->status == game_status::bye) {
		return util::fail(type::errc::already_completed, fmt::format("game {} was decided by a bye", number));
	}

	if (g->status == game_status::completed) {
		if (!options.force) {
			return util::fail(type::errc::already_completed, fmt::format("game {} is already completed", number));
		}
		if (auto res = retract(games, *g); !res) {
			return std::unexpected(res.error());
		}
	}

	if (!g->has_both_teams()) {
		return util::fail(type::errc::game_not_ready, fmt::format("game {} does not have both teams yet", number));
	}

	if (!g->involves(winner)) {
		return util::fail(type::errc::invalid_winner, fmt::format("team {} is not playing in game {}", winner, number));
	}

	const auto opponent = *g->opponent_of(winner);
	if (loser && *loser != opponent) {
		return util::fail(type::errc::invalid_winner, fmt::format("team {} is not the opponent of team {} in game {}", *loser, winner, number));
	}

	g->status = game_status::completed;
	g->winner = winner;
	g->loser = opponent;
	g->team1_score = options.team1_score;
	g->team2_score = options.team2_score;

	// Grand final: when the winners-bracket side (team1) wins, the loser is out and no reset is played
	const bool is_grand_final = g->is_grand_final;
	const bool winners_side_won = is_grand_final && winner == g->team1;
	const auto winner_edge = g->winner_advances_to;
	const auto loser_edge = winners_side_won ? std::nullopt : g->loser_advances_to;

	std::vector<slot_update> updates;
	for (const auto &[edge, team] : {std::pair{winner_edge, winner}, std::pair{loser_edge, opponent}}) {
		if (!edge) {
			continue;
		}

		auto *dest = find_game(games, edge->game);
		if (!dest) {
			return util::fail(type::errc::game_not_found, fmt::format("game {} advances into missing game {}", number, edge->game));
		}
		if (dest->is_decided()) {
			return util::fail(type::errc::invalid_state, fmt::format("game {} advances into game {} which is already decided", number, edge->game));
		}

		dest->set_team(edge->target, team);
		updates.push_back({.game = edge->game, .target = edge->target, .team = team});

		if (dest->status == game_status::pending && dest->has_both_teams()) {
			dest->status = game_status::ready;
		}
	}

	auto resolved = resolution_service::resolve(std::move(games));
	if (!resolved) {
		return std::unexpected(resolved.error());
	}

	return advance_result{.games = std::move(resolved->games),
												.updates = std::move(updates),
												.resolution = resolved->stats,
												.reset_required = is_grand_final && !winners_side_won};
}

} // namespace tourney
