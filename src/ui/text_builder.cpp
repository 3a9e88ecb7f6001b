#include "core/constants.hpp"
#include "ui/text_builder.hpp"
#include <fmt/format.h>

#include <algorithm>

namespace tourney::ui {

auto text_builder::build_help() -> std::string
{
	return "Usage: tourney [--data-dir DIR] <command> [args]\n"
				 "\n"
				 "Teams and seeding\n"
				 "  team-add <id> <number> <name>      register or update a team\n"
				 "  teams                              list registered teams\n"
				 "  score <team> <round> <value>       record a seeding round score\n"
				 "  unscore <team> <round>             delete a seeding round score\n"
				 "  rankings                           recalculate and show seeding rankings\n"
				 "\n"
				 "Brackets\n"
				 "  template <size>                    show the game graph for 4, 8, 16, 32 or 64 slots\n"
				 "  bracket-create <name> [size]       create a bracket seeded from the rankings\n"
				 "  seed <name> <position> <team|bye>  override one seed position\n"
				 "  reseed <name>                      re-seed from the current rankings\n"
				 "  generate <name>                    create the games and resolve byes\n"
				 "  show <name>                        show entries and games\n"
				 "  advance <name> <game> <winner> [--force] [--score <s1> <s2>]\n"
				 "                                     record a game result\n"
				 "  brackets                           list brackets\n";
}

auto text_builder::team_label(type::team_id id, std::span<const team> teams) -> std::string
{
	auto it = std::ranges::find(teams, id, &team::id);
	if (it == teams.end()) {
		return fmt::format("team {}", id);
	}
	return fmt::format("#{}", it->label());
}

auto text_builder::slot_label(const game &g, slot s, std::span<const team> teams) -> std::string
{
	if (auto t = g.team(s)) {
		return team_label(*t, teams);
	}
	return fmt::format("({})", g.source(s).to_string());
}

auto text_builder::build_template(std::span<const game_template> templates) -> std::string
{
	std::string out;
	for (const auto &t : templates) {
		std::string edges;
		if (t.winner_advances_to) {
			edges += fmt::format(" W->{}.{}", t.winner_advances_to->game, to_string(t.winner_advances_to->target));
		}
		if (t.loser_advances_to) {
			edges += fmt::format(" L->{}.{}", t.loser_advances_to->game, to_string(t.loser_advances_to->target));
		}
		out += fmt::format("G{:<3} {:<8} d{:<2} {:<20} {:>10} vs {:<10}{}\n", t.number, to_string(t.side), t.round_number, t.round_name,
											 t.team1_source.to_string(), t.team2_source.to_string(), edges);
	}
	return out;
}

auto text_builder::build_team_list(std::span<const team> teams) -> std::string
{
	std::string out;
	for (const auto &t : teams) {
		out += fmt::format("{:>4}  {:<24} (id {})\n", t.number, t.name, t.id);
	}
	return out;
}

auto text_builder::build_rankings(const ranking_summary &summary, std::span<const team> teams) -> std::string
{
	std::string out = fmt::format("{:>4}  {:<28} {:>9} {:>11} {:>8}\n", "rank", "team", "average", "tiebreaker", "raw");
	for (const auto &r : summary.rankings) {
		if (!r.is_ranked()) {
			out += fmt::format("{:>4}  {:<28} {:>9}\n", "-", team_label(r.team, teams), "unranked");
			continue;
		}
		out += fmt::format("{:>4}  {:<28} {:>9.2f} {:>11.2f} {:>8.4f}\n", *r.seed_rank, team_label(r.team, teams), *r.seed_average,
											 r.tiebreaker_value.value_or(0.0), r.raw_seed_score.value_or(0.0));
	}
	out += fmt::format("{} ranked, {} unranked\n", summary.teams_ranked, summary.teams_unranked);
	return out;
}

auto text_builder::build_bracket(const bracket &b, std::span<const team> teams) -> std::string
{
	std::string out = fmt::format("{} ({} slots, {} teams, {})\n", b.name, b.bracket_size, b.actual_team_count, to_string(b.status));

	out += "\nEntries\n";
	for (const auto &e : b.entries) {
		out += fmt::format("  seed {:>2}: {}\n", e.seed_position, e.team ? team_label(*e.team, teams) : std::string{"bye"});
	}

	if (b.games.empty()) {
		out += fmt::format("\n{}\n", constants::text::no_games);
		return out;
	}

	out += "\nGames\n";
	for (const auto &g : b.games) {
		std::string result;
		if (g.status == game_status::completed && g.winner) {
			result = fmt::format(" -> {}", team_label(*g.winner, teams));
			if (g.team1_score && g.team2_score) {
				result += fmt::format(" ({}-{})", *g.team1_score, *g.team2_score);
			}
		}
		else if (g.status == game_status::bye) {
			result = g.winner ? fmt::format(" -> {} (bye)", team_label(*g.winner, teams)) : std::string{" (empty)"};
		}
		out += fmt::format("  G{:<3} {:<20} {:<9} {} vs {}{}\n", g.number, g.round_name, to_string(g.status), slot_label(g, slot::team1, teams),
											 slot_label(g, slot::team2, teams), result);
	}

	if (auto champ = b.champion()) {
		out += fmt::format("\n{}{}\n", constants::text::trophy, team_label(*champ, teams));
	}
	return out;
}

auto text_builder::build_bracket_list(std::span<const bracket> brackets) -> std::string
{
	std::string out;
	for (const auto &b : brackets) {
		const auto done = std::ranges::count_if(b.games, &game::is_decided);
		out += fmt::format("{:<20} {:>2} slots {:>2} teams {:<12} {}/{} games decided\n", b.name, b.bracket_size, b.actual_team_count, to_string(b.status),
											 done, b.games.size());
	}
	return out;
}

auto text_builder::build_record(const bracket &b, type::game_number number, const record_outcome &outcome, std::span<const team> teams) -> std::string
{
	if (!outcome.changed) {
		return fmt::format("game {} already has this result", number);
	}

	std::string out = fmt::format("recorded game {} in {}", number, b.name);
	for (const auto &u : outcome.updates) {
		out += fmt::format("\n  {} -> game {} {}", team_label(u.team, teams), u.game, to_string(u.target));
	}
	if (outcome.resolution.byes_resolved > 0) {
		out += fmt::format("\n  {} byes resolved", outcome.resolution.byes_resolved);
	}
	if (outcome.reset_required) {
		out += "\n  championship reset required";
	}
	if (outcome.champion) {
		out += fmt::format("\n{}{}", constants::text::trophy, team_label(*outcome.champion, teams));
	}
	return out;
}

} // namespace tourney::ui
