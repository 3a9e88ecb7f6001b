#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace tourney::detail {

// Optional values are stored as JSON null.
template <typename T>
[[nodiscard]] auto optional_to_json(const std::optional<T> &v) -> nlohmann::json
{
	return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

template <typename T>
[[nodiscard]] auto optional_from_json(const nlohmann::json &j, const std::string &key) -> std::optional<T>
{
	const auto it = j.find(key);
	if (it == j.end() || it->is_null()) {
		return std::nullopt;
	}
	return it->template get<T>();
}

} // namespace tourney::detail
