#pragma once

#include "core/constants.hpp"
#include <fmt/format.h>

#include <string>
#include <string_view>

namespace tourney::ui {

class message_builder {
public:
	[[nodiscard]] static auto error(std::string_view msg) -> std::string { return fmt::format("{}{}", constants::text::err_prefix, msg); }

	[[nodiscard]] static auto success(std::string_view msg) -> std::string { return fmt::format("{}{}", constants::text::ok_prefix, msg); }
};

} // namespace tourney::ui
