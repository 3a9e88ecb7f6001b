#include "core/constants.hpp"
#include "services/persistence_service.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>

namespace tourney {

auto persistence_service::read_json(std::string_view file) const -> type::result<std::optional<nlohmann::json>>
{
	const auto path = path_of(file);
	if (!std::filesystem::exists(path)) {
		return std::nullopt;
	}

	try { // The try block is for nlohmann::json
		std::ifstream in(path);
		if (!in) {
			return util::fail(type::errc::io_failure, fmt::format("cannot open {}", path.string()));
		}
		nlohmann::json j;
		in >> j;
		return j;
	} catch (const std::exception &e) {
		return util::fail(type::errc::io_failure, fmt::format("cannot read {}: {}", path.string(), e.what()));
	}
}

auto persistence_service::write_json(std::string_view file, const nlohmann::json &j) const -> type::result<type::ok_t>
{
	const auto path = path_of(file);

	std::error_code ec;
	std::filesystem::create_directories(data_dir_, ec);
	if (ec) {
		return util::fail(type::errc::io_failure, fmt::format("cannot create {}: {}", data_dir_.string(), ec.message()));
	}

	std::ofstream out(path);
	if (!out) {
		return util::fail(type::errc::io_failure, fmt::format("cannot open {} for writing", path.string()));
	}
	out << j.dump(2);
	if (!out) {
		return util::fail(type::errc::io_failure, fmt::format("cannot write {}", path.string()));
	}
	return type::ok_t{};
}

auto persistence_service::load_teams() -> type::result<std::map<type::team_id, team>>
{
	std::map<type::team_id, team> teams;

	auto j = read_json(constants::files::teams_file);
	if (!j) {
		return std::unexpected(j.error());
	}
	if (!*j) {
		return teams;
	}

	try {
		for (const auto &item : **j) {
			auto t = team::from_json(item);
			teams.emplace(t.id, std::move(t));
		}
		return teams;
	} catch (const std::exception &e) {
		return util::fail(type::errc::io_failure, fmt::format("cannot load teams: {}", e.what()));
	}
}

auto persistence_service::save_teams(const std::map<type::team_id, team> &teams) -> type::result<type::ok_t>
{
	nlohmann::json j = nlohmann::json::array();
	for (const auto &[id, t] : teams) {
		j.push_back(t.to_json());
	}
	return write_json(constants::files::teams_file, j);
}

auto persistence_service::load_scores() -> type::result<std::vector<seeding_score>>
{
	std::vector<seeding_score> scores;

	auto j = read_json(constants::files::scores_file);
	if (!j) {
		return std::unexpected(j.error());
	}
	if (!*j) {
		return scores;
	}

	try {
		for (const auto &item : **j) {
			scores.push_back(seeding_score::from_json(item));
		}
		return scores;
	} catch (const std::exception &e) {
		return util::fail(type::errc::io_failure, fmt::format("cannot load seeding scores: {}", e.what()));
	}
}

auto persistence_service::save_scores(const std::vector<seeding_score> &scores) -> type::result<type::ok_t>
{
	nlohmann::json j = nlohmann::json::array();
	for (const auto &s : scores) {
		j.push_back(s.to_json());
	}
	return write_json(constants::files::scores_file, j);
}

auto persistence_service::load_rankings() -> type::result<std::vector<seeding_ranking>>
{
	std::vector<seeding_ranking> rankings;

	auto j = read_json(constants::files::rankings_file);
	if (!j) {
		return std::unexpected(j.error());
	}
	if (!*j) {
		return rankings;
	}

	try {
		for (const auto &item : **j) {
			rankings.push_back(seeding_ranking::from_json(item));
		}
		return rankings;
	} catch (const std::exception &e) {
		return util::fail(type::errc::io_failure, fmt::format("cannot load seeding rankings: {}", e.what()));
	}
}

auto persistence_service::save_rankings(const std::vector<seeding_ranking> &rankings) -> type::result<type::ok_t>
{
	nlohmann::json j = nlohmann::json::array();
	for (const auto &r : rankings) {
		j.push_back(r.to_json());
	}
	return write_json(constants::files::rankings_file, j);
}

auto persistence_service::load_brackets() -> type::result<std::map<std::string, bracket>>
{
	std::map<std::string, bracket> brackets;

	auto j = read_json(constants::files::brackets_file);
	if (!j) {
		return std::unexpected(j.error());
	}
	if (!*j) {
		return brackets;
	}

	try {
		for (const auto &item : **j) {
			auto b = bracket::from_json(item);
			auto name = b.name;
			brackets.emplace(std::move(name), std::move(b));
		}
		return brackets;
	} catch (const std::exception &e) {
		return util::fail(type::errc::io_failure, fmt::format("cannot load brackets: {}", e.what()));
	}
}

auto persistence_service::save_brackets(const std::map<std::string, bracket> &brackets) -> type::result<type::ok_t>
{
	nlohmann::json j = nlohmann::json::array();
	for (const auto &[name, b] : brackets) {
		j.push_back(b.to_json());
	}
	return write_json(constants::files::brackets_file, j);
}

} // namespace tourney
