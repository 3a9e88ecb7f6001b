#include "core/constants.hpp"
#include "services/ranking_service.hpp"
#include "services/seeding_service.hpp"
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace tourney {

seeding_service::seeding_service(std::shared_ptr<persistence_service> persistence, int seeding_rounds)
		: persistence_(std::move(persistence)), seeding_rounds_(seeding_rounds)
{
}

auto seeding_service::load() -> type::result<type::ok_t>
{
	if (auto teams_res = persistence_->load_teams()) {
		teams_ = std::move(*teams_res);
	}
	else {
		return std::unexpected(teams_res.error());
	}

	if (auto scores_res = persistence_->load_scores()) {
		scores_ = std::move(*scores_res);
	}
	else {
		return std::unexpected(scores_res.error());
	}

	if (auto rankings_res = persistence_->load_rankings()) {
		rankings_ = std::move(*rankings_res);
	}
	else {
		return std::unexpected(rankings_res.error());
	}

	return type::ok_t{};
}

auto seeding_service::save() const -> type::result<type::ok_t>
{
	if (auto res = persistence_->save_teams(teams_); !res) {
		return res;
	}
	if (auto res = persistence_->save_scores(scores_); !res) {
		return res;
	}
	if (auto res = persistence_->save_rankings(rankings_); !res) {
		return res;
	}
	return type::ok_t{};
}

auto seeding_service::upsert_team(type::team_id id, int number, std::string name) -> type::result<type::ok_t>
{
	if (id <= 0) {
		return util::fail(type::errc::invalid_entry, fmt::format("team id must be positive, got {}", id));
	}

	auto &t = teams_[id];
	t.id = id;
	t.number = number;
	t.name = std::move(name);
	return type::ok_t{};
}

auto seeding_service::find_team(type::team_id id) const -> std::optional<std::reference_wrapper<const team>>
{
	auto it = teams_.find(id);
	return it == teams_.end() ? std::nullopt : std::optional{std::cref(it->second)};
}

auto seeding_service::list_teams() const -> std::vector<team>
{
	std::vector<team> out;
	out.reserve(teams_.size());
	for (const auto &[id, t] : teams_) {
		out.push_back(t);
	}
	std::ranges::sort(out, std::less<>{}, &team::number);
	return out;
}

auto seeding_service::upsert_score(type::team_id id, int round, double score) -> type::result<type::ok_t>
{
	if (!teams_.contains(id)) {
		return util::fail(type::errc::not_found, fmt::format("{}: {}", constants::text::team_not_found, id));
	}
	if (round < 1 || round > seeding_rounds_) {
		return util::fail(type::errc::invalid_entry, fmt::format("round must be between 1 and {}, got {}", seeding_rounds_, round));
	}
	if (!std::isfinite(score)) {
		return util::fail(type::errc::invalid_entry, "score must be a finite number");
	}

	auto it = std::ranges::find_if(scores_, [&](const seeding_score &s) { return s.team == id && s.round == round; });
	if (it != scores_.end()) {
		it->score = score;
	}
	else {
		scores_.push_back({.team = id, .round = round, .score = score});
	}
	return type::ok_t{};
}

auto seeding_service::remove_score(type::team_id id, int round) -> type::result<type::ok_t>
{
	const auto removed = std::erase_if(scores_, [&](const seeding_score &s) { return s.team == id && s.round == round; });
	if (removed == 0) {
		return util::fail(type::errc::not_found, fmt::format("no score for team {} in round {}", id, round));
	}
	return type::ok_t{};
}

auto seeding_service::scores_of(type::team_id id) const -> std::vector<seeding_score>
{
	std::vector<seeding_score> out;
	std::ranges::copy_if(scores_, std::back_inserter(out), [&](const seeding_score &s) { return s.team == id; });
	std::ranges::sort(out, std::less<>{}, &seeding_score::round);
	return out;
}

auto seeding_service::recalculate_rankings() -> ranking_summary
{
	std::map<type::team_id, std::vector<double>> table;
	for (const auto &[id, t] : teams_) {
		table[id];
	}
	for (const auto &s : scores_) {
		if (teams_.contains(s.team)) {
			table[s.team].push_back(s.score);
		}
	}

	auto summary = ranking_service::calculate(table);
	rankings_ = summary.rankings;
	return summary;
}

auto seeding_service::ranked_teams() const -> std::vector<type::team_id>
{
	std::vector<type::team_id> out;
	for (const auto &r : rankings_) {
		if (r.is_ranked()) {
			out.push_back(r.team);
		}
	}
	return out;
}

} // namespace tourney
