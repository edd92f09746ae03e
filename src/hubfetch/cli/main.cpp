// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/cli/commands.hpp>
#include <hubfetch/core/http_session.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

using namespace hubfetch::cli;

int main(int argc, char* argv[]) {
    // Logs go to stderr so they do not tear the progress bar
    spdlog::set_default_logger(spdlog::stderr_color_mt("hubfetch"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }
    if (args.command == Command::none) {
        print_help(argv[0]);
        return 1;
    }

    auto config = build_config(args);
    if (!config) {
        std::cerr << "Error: " << config.error().message() << std::endl;
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config->log_level));

    hubfetch::core::HttpSession::global_init();

    CliResult result;
    switch (args.command) {
        case Command::file: result = download_file(args, *config); break;
        case Command::repo: result = download_repo(args, *config); break;
        case Command::info: result = info(args, *config); break;
        default:            result = 1; break;
    }

    hubfetch::core::HttpSession::global_cleanup();

    return result ? *result : 1;
}
