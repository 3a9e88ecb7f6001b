#include "services/resolution_service.hpp"
#include <fmt/format.h>

#include <deque>
#include <optional>
#include <unordered_map>

namespace tourney {

namespace {

using game_index = std::unordered_map<type::game_number, std::size_t>;

// resolved == false: the feeding game is still undecided.
// resolved with no team: the slot can never be filled.
struct source_state {
	bool resolved{};
	std::optional<type::team_id> team;
};

auto index_games(const std::vector<game> &games) -> game_index
{
	game_index index;
	index.reserve(games.size());
	for (std::size_t i = 0; i < games.size(); ++i) {
		index.emplace(games[i].number, i);
	}
	return index;
}

auto resolve_source(const game &g, slot s, const std::vector<game> &games, const game_index &index) -> source_state
{
	const auto &src = g.source(s);

	// Seed slots are written at instantiation; an empty one is a bye
	if (src.is_seed()) {
		return {true, g.team(s)};
	}

	auto it = index.find(src.ref);
	if (it == index.end()) {
		return {true, std::nullopt};
	}

	const auto &feeder = games[it->second];
	if (!feeder.is_decided()) {
		return {false, std::nullopt};
	}

	if (src.from == slot_source::kind::winner_of) {
		return {true, feeder.winner};
	}

	if (feeder.status == game_status::bye) {
		return {true, std::nullopt};
	}

	// Winners-bracket representative (team1) took the grand final: nobody drops into the reset
	if (g.is_reset_game && feeder.is_grand_final && feeder.winner && feeder.winner == feeder.team1) {
		return {true, std::nullopt};
	}

	return {true, feeder.loser};
}

} // namespace

auto resolution_service::check_acyclic(const std::vector<game> &games) -> type::result<type::ok_t>
{
	game_index index;
	for (std::size_t i = 0; i < games.size(); ++i) {
		if (!index.emplace(games[i].number, i).second) {
			return util::fail(type::errc::invalid_state, fmt::format("game number {} appears twice", games[i].number));
		}
	}

	std::vector<int> pending_sources(games.size(), 0);
	std::vector<std::vector<std::size_t>> dependents(games.size());

	for (std::size_t i = 0; i < games.size(); ++i) {
		for (slot s : {slot::team1, slot::team2}) {
			const auto &src = games[i].source(s);
			if (!src.references_game()) {
				continue;
			}
			if (auto it = index.find(src.ref); it != index.end()) {
				dependents[it->second].push_back(i);
				++pending_sources[i];
			}
		}
	}

	std::deque<std::size_t> queue;
	for (std::size_t i = 0; i < games.size(); ++i) {
		if (pending_sources[i] == 0) {
			queue.push_back(i);
		}
	}

	std::size_t visited = 0;
	while (!queue.empty()) {
		const auto i = queue.front();
		queue.pop_front();
		++visited;
		for (auto d : dependents[i]) {
			if (--pending_sources[d] == 0) {
				queue.push_back(d);
			}
		}
	}

	if (visited != games.size()) {
		return util::fail(type::errc::cycle_detected, fmt::format("{} games take part in a source cycle", games.size() - visited));
	}
	return type::ok_t{};
}

auto resolution_service::resolve(std::vector<game> games) -> type::result<resolution>
{
	if (auto res = check_acyclic(games); !res) {
		return std::unexpected(res.error());
	}

	const auto index = index_games(games);
	const int max_passes = static_cast<int>(games.size()) + 1;
	resolution_stats stats;

	auto award_bye = [&](game &g, type::team_id team) {
		g.status = game_status::bye;
		g.winner = team;
		g.loser = std::nullopt;
		++stats.byes_resolved;

		if (!g.winner_advances_to) {
			return;
		}
		auto it = index.find(g.winner_advances_to->game);
		if (it == index.end()) {
			return;
		}
		auto &dest = games[it->second];
		if (!dest.is_decided() && !dest.team(g.winner_advances_to->target)) {
			dest.set_team(g.winner_advances_to->target, team);
			++stats.slots_filled;
		}
	};

	for (;;) {
		if (stats.passes >= max_passes) {
			return util::fail(type::errc::cycle_detected, fmt::format("bye resolution did not settle after {} passes", max_passes));
		}
		++stats.passes;
		bool changed = false;

		for (auto &g : games) {
			if (g.is_decided()) {
				continue;
			}

			const auto team1_state = resolve_source(g, slot::team1, games, index);
			const auto team2_state = resolve_source(g, slot::team2, games, index);

			// Fill from decided winners only
			for (const auto &[s, state] : {std::pair{slot::team1, team1_state}, std::pair{slot::team2, team2_state}}) {
				if (!g.team(s) && state.team && g.source(s).from == slot_source::kind::winner_of) {
					g.set_team(s, state.team);
					++stats.slots_filled;
					changed = true;
				}
			}

			const bool has1 = g.team1.has_value();
			const bool has2 = g.team2.has_value();
			const bool gone1 = !has1 && team1_state.resolved && !team1_state.team;
			const bool gone2 = !has2 && team2_state.resolved && !team2_state.team;

			if (has1 && gone2) {
				award_bye(g, *g.team1);
				changed = true;
			}
			else if (has2 && gone1) {
				award_bye(g, *g.team2);
				changed = true;
			}
			else if (gone1 && gone2) {
				// Nobody can reach this game; it passes the gap on
				g.status = game_status::bye;
				g.winner = std::nullopt;
				g.loser = std::nullopt;
				changed = true;
			}
			else if (g.status == game_status::pending && has1 && has2) {
				g.status = game_status::ready;
				++stats.games_readied;
				changed = true;
			}
		}

		if (!changed) {
			break;
		}
	}

	return resolution{.games = std::move(games), .stats = stats};
}

} // namespace tourney
