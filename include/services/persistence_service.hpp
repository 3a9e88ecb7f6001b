#pragma once

#include "core/utils.hpp"
#include "models/bracket.hpp"
#include "models/seeding.hpp"
#include "models/team.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tourney {

// JSON files under one data directory. A missing file loads as empty.
class persistence_service {
public:
	explicit persistence_service(std::filesystem::path data_dir = ".") : data_dir_{std::move(data_dir)} {}

	// Team operations
	[[nodiscard]] auto load_teams() -> type::result<std::map<type::team_id, team>>;
	[[nodiscard]] auto save_teams(const std::map<type::team_id, team> &teams) -> type::result<type::ok_t>;

	// Seeding operations
	[[nodiscard]] auto load_scores() -> type::result<std::vector<seeding_score>>;
	[[nodiscard]] auto save_scores(const std::vector<seeding_score> &scores) -> type::result<type::ok_t>;
	[[nodiscard]] auto load_rankings() -> type::result<std::vector<seeding_ranking>>;
	[[nodiscard]] auto save_rankings(const std::vector<seeding_ranking> &rankings) -> type::result<type::ok_t>;

	// Bracket operations
	[[nodiscard]] auto load_brackets() -> type::result<std::map<std::string, bracket>>;
	[[nodiscard]] auto save_brackets(const std::map<std::string, bracket> &brackets) -> type::result<type::ok_t>;

private:
	std::filesystem::path data_dir_;

	[[nodiscard]] auto path_of(std::string_view file) const -> std::filesystem::path { return data_dir_ / file; }

	// nullopt when the file does not exist
	[[nodiscard]] auto read_json(std::string_view file) const -> type::result<std::optional<nlohmann::json>>;
	[[nodiscard]] auto write_json(std::string_view file, const nlohmann::json &j) const -> type::result<type::ok_t>;
};

} // namespace tourney
