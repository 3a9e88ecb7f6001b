#include "core/constants.hpp"
#include "services/template_service.hpp"
#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <utility>

namespace tourney {

namespace {

auto winners_round_name(int round, int rounds) -> std::string
{
	if (round == rounds)
		return "Winners Final";
	if (round == rounds - 1 && rounds >= 3)
		return "Winners Semi";
	return fmt::format("Winners R{}", round);
}

auto losers_round_name(int round, int rounds) -> std::string
{
	if (round == rounds)
		return "Losers Final";
	if (round == rounds - 1 && rounds >= 4)
		return "Losers Semi";
	return fmt::format("Losers R{}", round);
}

// Appends games in topological order. A game sits one round deeper than its deepest source.
class graph_builder {
public:
	explicit graph_builder(int bracket_size) : bracket_size_(bracket_size) {}

	auto add(std::string round_name, bracket_side side, slot_source team1, slot_source team2) -> type::game_number
	{
		game_template t;
		t.bracket_size = bracket_size_;
		t.number = util::narrow_cast<type::game_number>(games_.size()) + 1;
		t.round_name = std::move(round_name);
		t.round_number = 1 + std::max(depth(team1), depth(team2));
		t.side = side;
		t.team1_source = team1;
		t.team2_source = team2;
		games_.push_back(std::move(t));
		return games_.back().number;
	}

	auto at(type::game_number number) -> game_template & { return games_[static_cast<std::size_t>(number - 1)]; }

	// Forward edges are the inverse of the source references.
	auto link() -> void
	{
		for (std::size_t i = 0; i < games_.size(); ++i) {
			for (slot s : {slot::team1, slot::team2}) {
				const auto src = games_[i].source(s);
				const advancement edge{.game = games_[i].number, .target = s};

				if (src.from == slot_source::kind::winner_of) {
					at(src.ref).winner_advances_to = edge;
				}
				else if (src.from == slot_source::kind::loser_of) {
					at(src.ref).loser_advances_to = edge;
				}
			}
		}
	}

	[[nodiscard]] auto release() -> std::vector<game_template> { return std::move(games_); }

private:
	int bracket_size_;
	std::vector<game_template> games_;

	[[nodiscard]] auto depth(const slot_source &src) const -> int
	{
		return src.is_seed() ? 0 : games_[static_cast<std::size_t>(src.ref - 1)].round_number;
	}
};

} // namespace

auto template_service::is_supported_size(int bracket_size) noexcept -> bool
{
	return std::ranges::find(constants::limits::supported_bracket_sizes, bracket_size) != constants::limits::supported_bracket_sizes.end();
}

auto template_service::generate_seed_order(int size) -> type::result<std::vector<int>>
{
	if (size < 2 || !util::is_power_of_two(size)) {
		return util::fail(type::errc::unsupported_size, fmt::format("seed order needs a power of two >= 2, got {}", size));
	}

	std::vector<int> order{1, 2};
	for (int n = 4; n <= size; n *= 2) {
		std::vector<int> next;
		next.reserve(static_cast<std::size_t>(n));
		for (int s : order) {
			next.push_back(s);
			next.push_back(n + 1 - s);
		}
		order = std::move(next);
	}
	return order;
}

auto template_service::size_for_team_count(std::size_t team_count) -> type::result<int>
{
	if (team_count < 2) {
		return util::fail(type::errc::invalid_entry, "a bracket needs at least two teams");
	}

	for (int size : constants::limits::supported_bracket_sizes) {
		if (static_cast<std::size_t>(size) >= team_count) {
			return size;
		}
	}
	return util::fail(type::errc::unsupported_size,
										fmt::format("{} teams exceed the largest bracket ({})", team_count, constants::limits::max_bracket_size));
}

auto template_service::build(int bracket_size) -> type::result<std::vector<game_template>>
{
	if (!is_supported_size(bracket_size)) {
		return util::fail(type::errc::unsupported_size, fmt::format("unsupported bracket size: {}", bracket_size));
	}

	auto order = generate_seed_order(bracket_size);
	if (!order) {
		return std::unexpected(order.error());
	}

	const int winners_rounds = util::log2_exact(bracket_size);
	const int losers_rounds = 2 * (winners_rounds - 1);
	graph_builder g{bracket_size};

	// Winners R1 plays the seed pairs (order[2i], order[2i+1])
	std::vector<type::game_number> winners;
	for (std::size_t i = 0; i + 1 < order->size(); i += 2) {
		winners.push_back(g.add(winners_round_name(1, winners_rounds), bracket_side::winners, slot_source::seed((*order)[i]),
														slot_source::seed((*order)[i + 1])));
	}

	std::vector<type::game_number> losers;
	int losers_round = 0;

	for (int round = 2; round <= winners_rounds; ++round) {
		std::vector<type::game_number> next_winners;
		for (std::size_t i = 0; i + 1 < winners.size(); i += 2) {
			next_winners.push_back(g.add(winners_round_name(round, winners_rounds), bracket_side::winners, slot_source::winner_of(winners[i]),
																	 slot_source::winner_of(winners[i + 1])));
		}

		// Pairing round: first the Winners R1 losers meet each other, later the losers-bracket survivors.
		++losers_round;
		const bool from_first_round = (round == 2);
		const auto &feeders = from_first_round ? winners : losers;
		std::vector<type::game_number> paired;
		for (std::size_t i = 0; i + 1 < feeders.size(); i += 2) {
			const auto team1 = from_first_round ? slot_source::loser_of(feeders[i]) : slot_source::winner_of(feeders[i]);
			const auto team2 = from_first_round ? slot_source::loser_of(feeders[i + 1]) : slot_source::winner_of(feeders[i + 1]);
			paired.push_back(g.add(losers_round_name(losers_round, losers_rounds), bracket_side::losers, team1, team2));
		}

		// Drop-in round: each survivor meets a team falling from this winners round.
		// The drop order is reversed on every other round so early opponents do not meet again.
		++losers_round;
		const bool reversed = (round % 2 == 0);
		std::vector<type::game_number> dropped;
		for (std::size_t i = 0; i < paired.size(); ++i) {
			const auto falling = reversed ? next_winners[next_winners.size() - 1 - i] : next_winners[i];
			dropped.push_back(g.add(losers_round_name(losers_round, losers_rounds), bracket_side::losers, slot_source::winner_of(paired[i]),
															slot_source::loser_of(falling)));
		}

		winners = std::move(next_winners);
		losers = std::move(dropped);
	}

	// Winners-bracket representative always enters the grand final as team1.
	const auto grand_final = g.add("Grand Final", bracket_side::finals, slot_source::winner_of(winners.front()), slot_source::winner_of(losers.front()));
	g.at(grand_final).is_grand_final = true;

	const auto reset = g.add("Championship Reset", bracket_side::finals, slot_source::loser_of(grand_final), slot_source::winner_of(grand_final));
	g.at(reset).is_reset_game = true;

	g.link();
	return g.release();
}

auto template_service::get(int bracket_size) -> type::result<std::reference_wrapper<const std::vector<game_template>>>
{
	if (auto it = cache_.find(bracket_size); it != cache_.end()) {
		return std::cref(it->second);
	}

	auto built = build(bracket_size);
	if (!built) {
		return std::unexpected(built.error());
	}

	const auto it = cache_.emplace(bracket_size, std::move(*built)).first;
	return std::cref(it->second);
}

} // namespace tourney
