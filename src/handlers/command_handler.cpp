#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "ui/message_builder.hpp"
#include "ui/text_builder.hpp"
#include <fmt/format.h>

#include <charconv>
#include <ostream>

namespace tourney {

namespace {

template <typename T>
auto parse_number(const std::string &s, std::string_view what) -> type::result<T>
{
	T value{};
	const auto *end = s.data() + s.size();
	auto [ptr, ec] = std::from_chars(s.data(), end, value);
	if (ec != std::errc{} || ptr != end) {
		return util::fail(type::errc::invalid_entry, fmt::format("{} must be a number, got '{}'", what, s));
	}
	return value;
}

auto expect_args(std::span<const std::string> args, std::size_t count, std::string_view usage) -> type::result<type::ok_t>
{
	if (args.size() < count + 1) {
		return util::fail(type::errc::invalid_entry, fmt::format("usage: {}", usage));
	}
	return type::ok_t{};
}

} // namespace

command_handler::command_handler(std::shared_ptr<seeding_service> seeding_svc, std::shared_ptr<bracket_service> bracket_svc)
		: seeding_svc_(std::move(seeding_svc)), bracket_svc_(std::move(bracket_svc))
{
}

auto command_handler::run(std::span<const std::string> args, std::ostream &out, std::ostream &err) -> int
{
	const std::string name = args.empty() ? "help" : args.front();

	auto dispatch = [&]() -> type::result<std::string> {
		if (name == "help")
			return cmd_help(args);
		if (name == "template")
			return cmd_template(args);
		if (name == "team-add")
			return cmd_team_add(args);
		if (name == "teams")
			return cmd_teams(args);
		if (name == "score")
			return cmd_score(args);
		if (name == "unscore")
			return cmd_unscore(args);
		if (name == "rankings")
			return cmd_rankings(args);
		if (name == "bracket-create")
			return cmd_bracket_create(args);
		if (name == "seed")
			return cmd_seed(args);
		if (name == "reseed")
			return cmd_reseed(args);
		if (name == "generate")
			return cmd_generate(args);
		if (name == "show")
			return cmd_show(args);
		if (name == "advance")
			return cmd_advance(args);
		if (name == "brackets")
			return cmd_brackets(args);

		return util::fail(type::errc::invalid_entry, fmt::format("{}: {}", constants::text::unknown_command, name));
	};

	auto res = dispatch();
	if (!res) {
		err << ui::message_builder::error(fmt::format("[{}] {}", util::errc_name(res.error().code), res.error().what())) << '\n';
		return 1;
	}

	out << *res;
	if (!res->empty() && res->back() != '\n') {
		out << '\n';
	}
	return 0;
}

auto command_handler::current_seed_order() -> type::result<std::vector<type::team_id>>
{
	auto summary = seeding_svc_->recalculate_rankings();
	if (summary.teams_ranked == 0) {
		return util::fail(type::errc::invalid_entry, constants::text::no_ranked_teams);
	}
	if (auto res = seeding_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return seeding_svc_->ranked_teams();
}

auto command_handler::cmd_help(args_t) -> type::result<std::string> { return ui::text_builder::build_help(); }

auto command_handler::cmd_template(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 1, "template <size>"); !res) {
		return std::unexpected(res.error());
	}
	auto size = parse_number<int>(args[1], "size");
	if (!size) {
		return std::unexpected(size.error());
	}

	auto templates = bracket_svc_->templates(*size);
	if (!templates) {
		return std::unexpected(templates.error());
	}
	return ui::text_builder::build_template(*templates);
}

auto command_handler::cmd_team_add(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 3, "team-add <id> <number> <name>"); !res) {
		return std::unexpected(res.error());
	}
	auto id = parse_number<type::team_id>(args[1], "team id");
	if (!id) {
		return std::unexpected(id.error());
	}
	auto number = parse_number<int>(args[2], "team number");
	if (!number) {
		return std::unexpected(number.error());
	}

	// Remaining words form the name
	std::string name = args[3];
	for (std::size_t i = 4; i < args.size(); ++i) {
		name += ' ' + args[i];
	}

	if (auto res = seeding_svc_->upsert_team(*id, *number, name); !res) {
		return std::unexpected(res.error());
	}
	if (auto res = seeding_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::message_builder::success(fmt::format("team {} {} saved (id {})", *number, name, *id));
}

auto command_handler::cmd_teams(args_t) -> type::result<std::string>
{
	auto teams = seeding_svc_->list_teams();
	if (teams.empty()) {
		return util::fail(type::errc::not_found, constants::text::no_teams);
	}
	return ui::text_builder::build_team_list(teams);
}

auto command_handler::cmd_score(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 3, "score <team> <round> <value>"); !res) {
		return std::unexpected(res.error());
	}
	auto id = parse_number<type::team_id>(args[1], "team id");
	if (!id) {
		return std::unexpected(id.error());
	}
	auto round = parse_number<int>(args[2], "round");
	if (!round) {
		return std::unexpected(round.error());
	}
	auto value = parse_number<double>(args[3], "score");
	if (!value) {
		return std::unexpected(value.error());
	}

	if (auto res = seeding_svc_->upsert_score(*id, *round, *value); !res) {
		return std::unexpected(res.error());
	}
	if (auto res = seeding_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::message_builder::success(fmt::format("team {} round {} score {}", *id, *round, *value));
}

auto command_handler::cmd_unscore(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 2, "unscore <team> <round>"); !res) {
		return std::unexpected(res.error());
	}
	auto id = parse_number<type::team_id>(args[1], "team id");
	if (!id) {
		return std::unexpected(id.error());
	}
	auto round = parse_number<int>(args[2], "round");
	if (!round) {
		return std::unexpected(round.error());
	}

	if (auto res = seeding_svc_->remove_score(*id, *round); !res) {
		return std::unexpected(res.error());
	}
	if (auto res = seeding_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::message_builder::success(fmt::format("removed team {} round {} score", *id, *round));
}

auto command_handler::cmd_rankings(args_t) -> type::result<std::string>
{
	auto summary = seeding_svc_->recalculate_rankings();
	if (auto res = seeding_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::text_builder::build_rankings(summary, seeding_svc_->list_teams());
}

auto command_handler::cmd_bracket_create(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 1, "bracket-create <name> [size]"); !res) {
		return std::unexpected(res.error());
	}

	std::optional<int> size;
	if (args.size() > 2) {
		auto parsed = parse_number<int>(args[2], "size");
		if (!parsed) {
			return std::unexpected(parsed.error());
		}
		size = *parsed;
	}

	auto order = current_seed_order();
	if (!order) {
		return std::unexpected(order.error());
	}

	auto created = bracket_svc_->create(args[1], *order, size);
	if (!created) {
		return std::unexpected(created.error());
	}
	if (auto res = bracket_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::message_builder::success(fmt::format("created bracket {} ({} slots, {} teams)", created->name, created->bracket_size, created->actual_team_count));
}

auto command_handler::cmd_seed(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 3, "seed <name> <position> <team|bye>"); !res) {
		return std::unexpected(res.error());
	}
	auto position = parse_number<int>(args[2], "seed position");
	if (!position) {
		return std::unexpected(position.error());
	}

	std::optional<type::team_id> team;
	if (args[3] != "bye") {
		auto id = parse_number<type::team_id>(args[3], "team id");
		if (!id) {
			return std::unexpected(id.error());
		}
		if (!seeding_svc_->find_team(*id)) {
			return util::fail(type::errc::not_found, fmt::format("{}: {}", constants::text::team_not_found, *id));
		}
		team = *id;
	}

	auto updated = bracket_svc_->set_seed(args[1], *position, team);
	if (!updated) {
		return std::unexpected(updated.error());
	}
	if (auto res = bracket_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::message_builder::success(fmt::format("seed {} of {} set to {}", *position, args[1], team ? std::to_string(*team) : std::string{"bye"}));
}

auto command_handler::cmd_reseed(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 1, "reseed <name>"); !res) {
		return std::unexpected(res.error());
	}

	auto order = current_seed_order();
	if (!order) {
		return std::unexpected(order.error());
	}

	auto updated = bracket_svc_->reseed(args[1], *order);
	if (!updated) {
		return std::unexpected(updated.error());
	}
	if (auto res = bracket_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::message_builder::success(fmt::format("re-seeded {} with {} teams", updated->name, updated->actual_team_count));
}

auto command_handler::cmd_generate(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 1, "generate <name>"); !res) {
		return std::unexpected(res.error());
	}

	auto stats = bracket_svc_->generate(args[1]);
	if (!stats) {
		return std::unexpected(stats.error());
	}
	if (auto res = bracket_svc_->save(); !res) {
		return std::unexpected(res.error());
	}
	return ui::message_builder::success(
			fmt::format("generated {}: {} byes resolved, {} games ready", args[1], stats->byes_resolved, stats->games_readied));
}

auto command_handler::cmd_show(args_t args) -> type::result<std::string>
{
	if (auto res = expect_args(args, 1, "show <name>"); !res) {
		return std::unexpected(res.error());
	}

	auto b = bracket_svc_->find(args[1]);
	if (!b) {
		return util::fail(type::errc::not_found, fmt::format("{}: {}", constants::text::bracket_not_found, args[1]));
	}
	return ui::text_builder::build_bracket(*b, seeding_svc_->list_teams());
}

auto command_handler::cmd_advance(args_t args) -> type::result<std::string>
{
	constexpr std::string_view usage = "advance <name> <game> <winner> [--force] [--score <s1> <s2>]";
	if (auto res = expect_args(args, 3, usage); !res) {
		return std::unexpected(res.error());
	}
	auto number = parse_number<type::game_number>(args[2], "game number");
	if (!number) {
		return std::unexpected(number.error());
	}
	auto winner = parse_number<type::team_id>(args[3], "winner");
	if (!winner) {
		return std::unexpected(winner.error());
	}

	advance_options options;
	for (std::size_t i = 4; i < args.size(); ++i) {
		if (args[i] == "--force") {
			options.force = true;
		}
		else if (args[i] == "--score" && i + 2 < args.size()) {
			auto s1 = parse_number<int>(args[i + 1], "score");
			if (!s1) {
				return std::unexpected(s1.error());
			}
			auto s2 = parse_number<int>(args[i + 2], "score");
			if (!s2) {
				return std::unexpected(s2.error());
			}
			options.team1_score = *s1;
			options.team2_score = *s2;
			i += 2;
		}
		else {
			return util::fail(type::errc::invalid_entry, fmt::format("usage: {}", usage));
		}
	}

	auto outcome = bracket_svc_->record_result(args[1], *number, *winner, options);
	if (!outcome) {
		return std::unexpected(outcome.error());
	}
	if (outcome->changed) {
		if (auto res = bracket_svc_->save(); !res) {
			return std::unexpected(res.error());
		}
	}

	auto b = bracket_svc_->find(args[1]);
	if (!b) {
		return util::fail(type::errc::not_found, fmt::format("{}: {}", constants::text::bracket_not_found, args[1]));
	}
	return ui::message_builder::success(ui::text_builder::build_record(*b, *number, *outcome, seeding_svc_->list_teams()));
}

auto command_handler::cmd_brackets(args_t) -> type::result<std::string>
{
	auto brackets = bracket_svc_->list();
	if (brackets.empty()) {
		return util::fail(type::errc::not_found, constants::text::bracket_not_found);
	}
	return ui::text_builder::build_bracket_list(brackets);
}

} // namespace tourney
