#pragma once

#include "core/utils.hpp"
#include "services/bracket_service.hpp"
#include "services/seeding_service.hpp"

#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace tourney {

class command_handler {
public:
	explicit command_handler(std::shared_ptr<seeding_service> seeding_svc, std::shared_ptr<bracket_service> bracket_svc);

	// Command dispatch; args[0] is the command name. Returns the process exit code.
	auto run(std::span<const std::string> args, std::ostream &out, std::ostream &err) -> int;

private:
	std::shared_ptr<seeding_service> seeding_svc_;
	std::shared_ptr<bracket_service> bracket_svc_;

	using args_t = std::span<const std::string>;

	// Command implementations; success text on the value side
	auto cmd_help(args_t args) -> type::result<std::string>;
	auto cmd_template(args_t args) -> type::result<std::string>;
	auto cmd_team_add(args_t args) -> type::result<std::string>;
	auto cmd_teams(args_t args) -> type::result<std::string>;
	auto cmd_score(args_t args) -> type::result<std::string>;
	auto cmd_unscore(args_t args) -> type::result<std::string>;
	auto cmd_rankings(args_t args) -> type::result<std::string>;
	auto cmd_bracket_create(args_t args) -> type::result<std::string>;
	auto cmd_seed(args_t args) -> type::result<std::string>;
	auto cmd_reseed(args_t args) -> type::result<std::string>;
	auto cmd_generate(args_t args) -> type::result<std::string>;
	auto cmd_show(args_t args) -> type::result<std::string>;
	auto cmd_advance(args_t args) -> type::result<std::string>;
	auto cmd_brackets(args_t args) -> type::result<std::string>;

	// Recalculate rankings and return the ranked team ids in seed order
	[[nodiscard]] auto current_seed_order() -> type::result<std::vector<type::team_id>>;
};

} // namespace tourney
