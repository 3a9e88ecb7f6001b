#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tourney {

namespace type {
// Strong type aliases
using team_id = std::int64_t;
using game_number = int;

using ok_t = std::monostate;

// Error handling
enum class errc {
	unsupported_size,
	invalid_entry,
	game_not_found,
	invalid_winner,
	already_completed,
	cycle_detected,
	game_not_ready,
	invalid_state,
	not_found,
	io_failure,
};

struct error {
	errc code{errc::invalid_state};
	std::string message;

	error() = default;
	error(errc c, std::string_view sv) : code(c), message(sv) {}

	[[nodiscard]] auto what() const -> std::string_view { return message; }
};

template <typename T>
using result = std::expected<T, error>;

} // namespace type

namespace util {

// Explicit (silent) narrowing cast, just a named static_cast.
template <std::integral To, std::integral From>
[[nodiscard]] constexpr To narrow_cast(From v) noexcept
{
	return static_cast<To>(v);
}

[[nodiscard]] constexpr auto is_power_of_two(int n) noexcept -> bool { return n > 0 && (n & (n - 1)) == 0; }

// log2 for powers of two
[[nodiscard]] constexpr auto log2_exact(int n) noexcept -> int
{
	int k = 0;
	while (n > 1) {
		n >>= 1;
		++k;
	}
	return k;
}

[[nodiscard]] inline auto fail(type::errc code, std::string_view msg) -> std::unexpected<type::error> { return std::unexpected(type::error{code, msg}); }

[[nodiscard]] constexpr auto errc_name(type::errc code) noexcept -> std::string_view
{
	switch (code) {
	case type::errc::unsupported_size:
		return "unsupported_size";
	case type::errc::invalid_entry:
		return "invalid_entry";
	case type::errc::game_not_found:
		return "game_not_found";
	case type::errc::invalid_winner:
		return "invalid_winner";
	case type::errc::already_completed:
		return "already_completed";
	case type::errc::cycle_detected:
		return "cycle_detected";
	case type::errc::game_not_ready:
		return "game_not_ready";
	case type::errc::invalid_state:
		return "invalid_state";
	case type::errc::not_found:
		return "not_found";
	case type::errc::io_failure:
		return "io_failure";
	}
	return "unknown";
}

} // namespace util

} // namespace tourney
