#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "services/bracket_service.hpp"
#include "services/persistence_service.hpp"
#include "services/seeding_service.hpp"
#include "ui/message_builder.hpp"
#include <fmt/format.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tourney;

int main(int argc, char **argv)
{
	std::vector<std::string> args(argv + 1, argv + argc);

	// Data directory: --data-dir, then the environment, then the working directory
	std::filesystem::path data_dir = ".";
	if (const char *env = std::getenv(std::string{constants::files::data_dir_env}.c_str()); env && *env) {
		data_dir = env;
	}
	if (args.size() >= 2 && args[0] == "--data-dir") {
		data_dir = args[1];
		args.erase(args.begin(), args.begin() + 2);
	}

	// Initialize services
	auto persistence = std::make_shared<persistence_service>(data_dir);
	auto seeding_svc = std::make_shared<seeding_service>(persistence);
	auto bracket_svc = std::make_shared<bracket_service>(persistence);

	// Load data
	if (auto res = seeding_svc->load(); !res) {
		std::cerr << ui::message_builder::error(fmt::format("load seeding data: {}", res.error().what())) << "\n";
		return 1;
	}
	if (auto res = bracket_svc->load(); !res) {
		std::cerr << ui::message_builder::error(fmt::format("load brackets: {}", res.error().what())) << "\n";
		return 1;
	}

	command_handler handler(seeding_svc, bracket_svc);

	try {
		return handler.run(args, std::cout, std::cerr);
	} catch (const std::exception &e) {
		std::cerr << ui::message_builder::error(e.what()) << "\n";
		return 1;
	}
}
