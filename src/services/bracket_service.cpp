#include "core/constants.hpp"
#include "services/bracket_service.hpp"
#include "services/instantiation_service.hpp"
#include <fmt/format.h>

#include <algorithm>

namespace tourney {

bracket_service::bracket_service(std::shared_ptr<persistence_service> persistence) : persistence_(std::move(persistence)) {}

auto bracket_service::load() -> type::result<type::ok_t>
{
	auto res = persistence_->load_brackets();
	if (!res) {
		return std::unexpected(res.error());
	}

	std::lock_guard lock(mutex_);
	brackets_ = std::move(*res);
	return type::ok_t{};
}

auto bracket_service::save() const -> type::result<type::ok_t>
{
	std::lock_guard lock(mutex_);
	return persistence_->save_brackets(brackets_);
}

auto bracket_service::lookup(const std::string &name) -> type::result<std::reference_wrapper<bracket>>
{
	auto it = brackets_.find(name);
	if (it == brackets_.end()) {
		return util::fail(type::errc::not_found, fmt::format("{}: {}", constants::text::bracket_not_found, name));
	}
	return std::ref(it->second);
}

auto bracket_service::count_teams(std::span<const entry> entries) -> int
{
	return util::narrow_cast<int>(std::ranges::count_if(entries, [](const entry &e) { return e.team.has_value(); }));
}

auto bracket_service::refresh_status(bracket &b) -> void
{
	if (b.games.empty()) {
		b.status = bracket_status::setup;
	}
	else if (b.champion()) {
		b.status = bracket_status::completed;
	}
	else {
		b.status = bracket_status::in_progress;
	}
}

auto bracket_service::create(std::string name, std::span<const type::team_id> ranked_teams, std::optional<int> bracket_size) -> type::result<bracket>
{
	if (name.empty()) {
		return util::fail(type::errc::invalid_entry, "bracket name must not be empty");
	}

	std::lock_guard lock(mutex_);
	if (brackets_.contains(name)) {
		return util::fail(type::errc::invalid_state, fmt::format("{}: {}", constants::text::bracket_exists, name));
	}

	int size = 0;
	if (bracket_size) {
		if (!template_service::is_supported_size(*bracket_size)) {
			return util::fail(type::errc::unsupported_size, fmt::format("unsupported bracket size: {}", *bracket_size));
		}
		size = *bracket_size;
	}
	else {
		auto fitted = template_service::size_for_team_count(ranked_teams.size());
		if (!fitted) {
			return std::unexpected(fitted.error());
		}
		size = *fitted;
	}

	auto entries = instantiation_service::entries_from_ranking(ranked_teams, size);
	if (!entries) {
		return std::unexpected(entries.error());
	}

	bracket b{.name = name, .bracket_size = size, .actual_team_count = count_teams(*entries), .status = bracket_status::setup, .entries = std::move(*entries)};
	auto it = brackets_.emplace(std::move(name), std::move(b)).first;
	return it->second;
}

auto bracket_service::set_seed(const std::string &name, int seed_position, std::optional<type::team_id> team) -> type::result<bracket>
{
	std::lock_guard lock(mutex_);
	auto found = lookup(name);
	if (!found) {
		return std::unexpected(found.error());
	}
	bracket &b = found->get();

	if (!b.games.empty()) {
		return util::fail(type::errc::invalid_state, constants::text::games_already_exist);
	}

	auto entries = b.entries;
	auto it = std::ranges::find(entries, seed_position, &entry::seed_position);
	const auto updated = team ? entry::with_team(seed_position, *team) : entry::bye(seed_position);
	if (it != entries.end()) {
		*it = updated;
	}
	else {
		entries.push_back(updated);
		std::ranges::sort(entries, std::less<>{}, &entry::seed_position);
	}

	if (auto res = instantiation_service::validate_entries(entries, b.bracket_size); !res) {
		return std::unexpected(res.error());
	}

	b.entries = std::move(entries);
	b.actual_team_count = count_teams(b.entries);
	return b;
}

auto bracket_service::reseed(const std::string &name, std::span<const type::team_id> ranked_teams) -> type::result<bracket>
{
	std::lock_guard lock(mutex_);
	auto found = lookup(name);
	if (!found) {
		return std::unexpected(found.error());
	}
	bracket &b = found->get();

	if (!b.games.empty()) {
		return util::fail(type::errc::invalid_state, constants::text::games_already_exist);
	}

	auto entries = instantiation_service::entries_from_ranking(ranked_teams, b.bracket_size);
	if (!entries) {
		return std::unexpected(entries.error());
	}

	b.entries = std::move(*entries);
	b.actual_team_count = count_teams(b.entries);
	return b;
}

auto bracket_service::generate(const std::string &name) -> type::result<resolution_stats>
{
	std::lock_guard lock(mutex_);
	auto found = lookup(name);
	if (!found) {
		return std::unexpected(found.error());
	}
	bracket &b = found->get();

	if (!b.games.empty()) {
		return util::fail(type::errc::invalid_state, fmt::format("bracket {} already has games", name));
	}

	auto tmpl = templates_.get(b.bracket_size);
	if (!tmpl) {
		return std::unexpected(tmpl.error());
	}

	auto games = instantiation_service::instantiate(tmpl->get(), b.entries);
	if (!games) {
		return std::unexpected(games.error());
	}

	auto resolved = resolution_service::resolve(std::move(*games));
	if (!resolved) {
		return std::unexpected(resolved.error());
	}

	b.games = std::move(resolved->games);
	refresh_status(b);
	return resolved->stats;
}

auto bracket_service::record_result(const std::string &name, type::game_number number, type::team_id winner, advance_options options)
		-> type::result<record_outcome>
{
	std::lock_guard lock(mutex_);
	auto found = lookup(name);
	if (!found) {
		return std::unexpected(found.error());
	}
	bracket &b = found->get();

	if (b.games.empty()) {
		return util::fail(type::errc::invalid_state, constants::text::no_games);
	}

	auto current = std::ranges::find(b.games, number, &game::number);
	if (current != b.games.end() && current->status == game_status::completed && current->winner == winner) {
		const bool new_scores = (options.team1_score || options.team2_score) &&
														(options.team1_score != current->team1_score || options.team2_score != current->team2_score);
		if (!new_scores) {
			return record_outcome{.changed = false, .champion = b.champion()};
		}
		// Same winner: only the scores change, nothing moves
		current->team1_score = options.team1_score;
		current->team2_score = options.team2_score;
		return record_outcome{.changed = true, .champion = b.champion()};
	}

	auto advanced = advancement_service::advance(b.games, number, winner, std::nullopt, options);
	if (!advanced) {
		return std::unexpected(advanced.error());
	}

	b.games = std::move(advanced->games);
	refresh_status(b);

	return record_outcome{.changed = true,
												.updates = std::move(advanced->updates),
												.resolution = advanced->resolution,
												.reset_required = advanced->reset_required,
												.champion = b.champion()};
}

auto bracket_service::find(const std::string &name) const -> std::optional<bracket>
{
	std::lock_guard lock(mutex_);
	auto it = brackets_.find(name);
	return it == brackets_.end() ? std::nullopt : std::optional{it->second};
}

auto bracket_service::list() const -> std::vector<bracket>
{
	std::lock_guard lock(mutex_);
	std::vector<bracket> out;
	out.reserve(brackets_.size());
	for (const auto &[name, b] : brackets_) {
		out.push_back(b);
	}
	return out;
}

auto bracket_service::templates(int bracket_size) -> type::result<std::vector<game_template>>
{
	std::lock_guard lock(mutex_);
	auto tmpl = templates_.get(bracket_size);
	if (!tmpl) {
		return std::unexpected(tmpl.error());
	}
	return tmpl->get();
}

} // namespace tourney
