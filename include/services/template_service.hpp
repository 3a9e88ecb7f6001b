#pragma once

#include "core/utils.hpp"
#include "models/game_template.hpp"

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace tourney {

class template_service {
public:
	// Standard "1 vs N, 2 vs N-1" seeding permutation; size must be a power of two >= 2.
	[[nodiscard]] static auto generate_seed_order(int size) -> type::result<std::vector<int>>;

	// Full double-elimination game graph for a bracket of 4, 8, 16, 32 or 64 slots.
	[[nodiscard]] static auto build(int bracket_size) -> type::result<std::vector<game_template>>;

	[[nodiscard]] static auto is_supported_size(int bracket_size) noexcept -> bool;

	// Smallest supported size that holds `team_count` teams.
	[[nodiscard]] static auto size_for_team_count(std::size_t team_count) -> type::result<int>;

	// Cached per instance; templates are a pure function of size.
	[[nodiscard]] auto get(int bracket_size) -> type::result<std::reference_wrapper<const std::vector<game_template>>>;

private:
	std::unordered_map<int, std::vector<game_template>> cache_;
};

} // namespace tourney
