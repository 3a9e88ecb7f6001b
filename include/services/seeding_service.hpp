#pragma once

#include "core/constants.hpp"
#include "core/utils.hpp"
#include "models/seeding.hpp"
#include "models/team.hpp"
#include "services/persistence_service.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tourney {

// Team registry and the seeding score table.
class seeding_service {
public:
	explicit seeding_service(std::shared_ptr<persistence_service> persistence, int seeding_rounds = constants::limits::default_seeding_rounds);

	// Team management
	[[nodiscard]] auto upsert_team(type::team_id id, int number, std::string name) -> type::result<type::ok_t>;
	[[nodiscard]] auto find_team(type::team_id id) const -> std::optional<std::reference_wrapper<const team>>;
	[[nodiscard]] auto list_teams() const -> std::vector<team>;

	// Score management, one score per (team, round)
	[[nodiscard]] auto upsert_score(type::team_id id, int round, double score) -> type::result<type::ok_t>;
	[[nodiscard]] auto remove_score(type::team_id id, int round) -> type::result<type::ok_t>;
	[[nodiscard]] auto scores_of(type::team_id id) const -> std::vector<seeding_score>;

	// Replace-all recalculation over every registered team
	[[nodiscard]] auto recalculate_rankings() -> ranking_summary;
	[[nodiscard]] auto rankings() const -> const std::vector<seeding_ranking> & { return rankings_; }
	[[nodiscard]] auto ranked_teams() const -> std::vector<type::team_id>;

	// Persistence
	[[nodiscard]] auto load() -> type::result<type::ok_t>;
	[[nodiscard]] auto save() const -> type::result<type::ok_t>;

private:
	std::shared_ptr<persistence_service> persistence_;
	int seeding_rounds_;
	std::map<type::team_id, team> teams_;
	std::vector<seeding_score> scores_;
	std::vector<seeding_ranking> rankings_;
};

} // namespace tourney
