#pragma once

#include "models/game.hpp"
#include "services/instantiation_service.hpp"
#include "services/resolution_service.hpp"
#include "services/template_service.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <numeric>
#include <string>
#include <vector>

namespace tourney::testing {

// Unwraps a result that the test expects to succeed
template <typename T>
auto must(type::result<T> res) -> T
{
	INFO((res ? std::string{} : std::string{res.error().what()}));
	REQUIRE(res.has_value());
	return std::move(*res);
}

template <typename T>
auto error_of(const type::result<T> &res) -> type::errc
{
	REQUIRE_FALSE(res.has_value());
	return res.error().code;
}

inline auto team_ids(int count) -> std::vector<type::team_id>
{
	std::vector<type::team_id> ids(static_cast<std::size_t>(count));
	std::iota(ids.begin(), ids.end(), type::team_id{1});
	return ids;
}

// Instantiated and resolved games, teams 1..team_count seeded in id order
inline auto seeded_games(int bracket_size, int team_count) -> std::vector<game>
{
	const auto templates = must(template_service::build(bracket_size));
	const auto ids = team_ids(team_count);
	const auto entries = must(instantiation_service::entries_from_ranking(ids, bracket_size));
	auto games = must(instantiation_service::instantiate(templates, entries));
	return must(resolution_service::resolve(std::move(games))).games;
}

inline auto at(const std::vector<game> &games, type::game_number number) -> const game &
{
	auto it = std::ranges::find(games, number, &game::number);
	REQUIRE(it != games.end());
	return *it;
}

// Scratch data directory removed on scope exit
class temp_dir {
public:
	temp_dir()
	{
		static std::atomic<int> counter{0};
		const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
		path_ = std::filesystem::temp_directory_path() / ("tourney_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
		std::filesystem::create_directories(path_);
	}

	~temp_dir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	temp_dir(const temp_dir &) = delete;
	auto operator=(const temp_dir &) -> temp_dir & = delete;

	[[nodiscard]] auto path() const -> const std::filesystem::path & { return path_; }

private:
	std::filesystem::path path_;
};

} // namespace tourney::testing
