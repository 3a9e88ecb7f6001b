#pragma once

#include "core/utils.hpp"
#include "models/bracket.hpp"
#include "services/advancement_service.hpp"
#include "services/persistence_service.hpp"
#include "services/resolution_service.hpp"
#include "services/template_service.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tourney {

struct record_outcome {
	bool changed{};													 // false when the same result was already recorded
	std::vector<slot_update> updates;
	resolution_stats resolution;
	bool reset_required{};
	std::optional<type::team_id> champion;
};

// Owns every bracket and serializes mutations on them.
class bracket_service {
public:
	explicit bracket_service(std::shared_ptr<persistence_service> persistence);

	// Bracket lifecycle
	[[nodiscard]] auto create(std::string name, std::span<const type::team_id> ranked_teams, std::optional<int> bracket_size = std::nullopt)
			-> type::result<bracket>;
	[[nodiscard]] auto set_seed(const std::string &name, int seed_position, std::optional<type::team_id> team) -> type::result<bracket>;
	[[nodiscard]] auto reseed(const std::string &name, std::span<const type::team_id> ranked_teams) -> type::result<bracket>;
	[[nodiscard]] auto generate(const std::string &name) -> type::result<resolution_stats>;

	/**
	 * @brief Record the winner of a game.
	 * Recording the winner a completed game already has is a no-op, even without force.
	 * A different winner needs options.force, and fails once a later game fed by it is decided.
	 */
	[[nodiscard]] auto record_result(const std::string &name, type::game_number number, type::team_id winner, advance_options options = {})
			-> type::result<record_outcome>;

	// Queries
	[[nodiscard]] auto find(const std::string &name) const -> std::optional<bracket>;
	[[nodiscard]] auto list() const -> std::vector<bracket>;

	// Template access for inspection
	[[nodiscard]] auto templates(int bracket_size) -> type::result<std::vector<game_template>>;

	// Persistence
	[[nodiscard]] auto load() -> type::result<type::ok_t>;
	[[nodiscard]] auto save() const -> type::result<type::ok_t>;

private:
	std::shared_ptr<persistence_service> persistence_;
	template_service templates_;
	std::map<std::string, bracket> brackets_;
	mutable std::mutex mutex_;

	[[nodiscard]] auto lookup(const std::string &name) -> type::result<std::reference_wrapper<bracket>>;
	[[nodiscard]] static auto count_teams(std::span<const entry> entries) -> int;
	static auto refresh_status(bracket &b) -> void;
};

} // namespace tourney
