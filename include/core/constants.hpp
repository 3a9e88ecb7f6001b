#pragma once

#include <array>
#include <string_view>

namespace tourney::constants {

// UI Text
namespace text {
inline constexpr std::string_view unknown_command = "unknown command";
inline constexpr std::string_view bracket_not_found = "bracket not found";
inline constexpr std::string_view bracket_exists = "a bracket with this name already exists";
inline constexpr std::string_view team_not_found = "team not found";
inline constexpr std::string_view games_already_exist = "bracket already has games; entries are locked";
inline constexpr std::string_view no_games = "bracket has no games yet";
inline constexpr std::string_view no_teams = "no teams registered";
inline constexpr std::string_view no_ranked_teams = "no ranked teams to seed";

inline constexpr std::string_view ok_prefix = "✅ ";
inline constexpr std::string_view err_prefix = "❌ ";
inline constexpr std::string_view trophy = "🏆 ";
} // namespace text

// File paths
namespace files {
inline constexpr std::string_view teams_file = "teams.json";
inline constexpr std::string_view scores_file = "seeding_scores.json";
inline constexpr std::string_view rankings_file = "seeding_rankings.json";
inline constexpr std::string_view brackets_file = "brackets.json";
inline constexpr std::string_view data_dir_env = "TOURNEY_DATA_DIR";
} // namespace files

// Limits
namespace limits {
inline constexpr std::array<int, 5> supported_bracket_sizes{4, 8, 16, 32, 64};
inline constexpr int max_bracket_size = 64;
inline constexpr int default_seeding_rounds = 3;
} // namespace limits

// Seeding score weights
namespace seeding {
inline constexpr double rank_weight = 0.75;
inline constexpr double average_weight = 0.25;
} // namespace seeding

} // namespace tourney::constants
