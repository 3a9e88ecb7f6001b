#include "services/instantiation_service.hpp"
#include "services/template_service.hpp"
#include <fmt/format.h>

#include <unordered_map>
#include <unordered_set>

namespace tourney {

auto instantiation_service::validate_entries(std::span<const entry> entries, int bracket_size) -> type::result<type::ok_t>
{
	if (!template_service::is_supported_size(bracket_size)) {
		return util::fail(type::errc::unsupported_size, fmt::format("unsupported bracket size: {}", bracket_size));
	}

	std::unordered_set<int> seeds;
	std::unordered_set<type::team_id> teams;
	std::unordered_set<int> filled;

	for (const auto &e : entries) {
		if (e.seed_position < 1 || e.seed_position > bracket_size) {
			return util::fail(type::errc::invalid_entry, fmt::format("seed position {} is outside 1..{}", e.seed_position, bracket_size));
		}

		if (!e.well_formed()) {
			return util::fail(type::errc::invalid_entry, e.is_bye ? fmt::format("bye at seed {} must not carry a team", e.seed_position)
																														: fmt::format("seed {} has no team and is not a bye", e.seed_position));
		}

		if (!seeds.insert(e.seed_position).second) {
			return util::fail(type::errc::invalid_entry, fmt::format("seed position {} is used twice", e.seed_position));
		}

		if (e.team) {
			if (!teams.insert(*e.team).second) {
				return util::fail(type::errc::invalid_entry, fmt::format("team {} is entered twice", *e.team));
			}
			filled.insert(e.seed_position);
		}
	}

	// Every first-round game needs at least one team
	auto order = template_service::generate_seed_order(bracket_size);
	if (!order) {
		return std::unexpected(order.error());
	}

	for (std::size_t i = 0; i + 1 < order->size(); i += 2) {
		const int a = (*order)[i];
		const int b = (*order)[i + 1];
		if (!filled.contains(a) && !filled.contains(b)) {
			return util::fail(type::errc::invalid_entry, fmt::format("seeds {} and {} are both byes in the same first-round game", a, b));
		}
	}

	return type::ok_t{};
}

auto instantiation_service::entries_from_ranking(std::span<const type::team_id> ranked_teams, int bracket_size) -> type::result<std::vector<entry>>
{
	if (ranked_teams.size() > static_cast<std::size_t>(bracket_size)) {
		return util::fail(type::errc::invalid_entry, fmt::format("{} teams do not fit a bracket of {}", ranked_teams.size(), bracket_size));
	}

	std::vector<entry> out;
	out.reserve(static_cast<std::size_t>(bracket_size));
	for (int seed = 1; seed <= bracket_size; ++seed) {
		const auto idx = static_cast<std::size_t>(seed - 1);
		out.push_back(idx < ranked_teams.size() ? entry::with_team(seed, ranked_teams[idx]) : entry::bye(seed));
	}

	if (auto res = validate_entries(out, bracket_size); !res) {
		return std::unexpected(res.error());
	}
	return out;
}

auto instantiation_service::instantiate(std::span<const game_template> templates, std::span<const entry> entries) -> type::result<std::vector<game>>
{
	if (templates.empty()) {
		return util::fail(type::errc::invalid_state, "cannot instantiate an empty template");
	}

	const int bracket_size = templates.front().bracket_size;
	if (auto res = validate_entries(entries, bracket_size); !res) {
		return std::unexpected(res.error());
	}

	std::unordered_map<int, type::team_id> team_at;
	for (const auto &e : entries) {
		if (e.team) {
			team_at.emplace(e.seed_position, *e.team);
		}
	}

	auto seed_team = [&](const slot_source &src) -> std::optional<type::team_id> {
		auto it = team_at.find(src.ref);
		return it == team_at.end() ? std::nullopt : std::optional{it->second};
	};

	std::vector<game> games;
	games.reserve(templates.size());

	for (const auto &t : templates) {
		auto g = game::from_template(t);

		for (slot s : {slot::team1, slot::team2}) {
			if (t.source(s).is_seed()) {
				g.set_team(s, seed_team(t.source(s)));
			}
		}

		if (g.has_both_teams()) {
			g.status = game_status::ready;
		}
		else {
			// A seed slot left empty here is a bye for good
			for (slot s : {slot::team1, slot::team2}) {
				const bool opponent_is_bye = t.source(other(s)).is_seed() && !g.team(other(s));
				if (g.team(s) && opponent_is_bye) {
					g.status = game_status::bye;
					g.winner = g.team(s);
				}
			}
		}

		games.push_back(std::move(g));
	}

	return games;
}

} // namespace tourney
