// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/core/log.hpp>
#include <exception>
#include <cstdlib>
#include <iostream>

using namespace reel::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void reel_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(reel_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    auto level = args.verbose ? spdlog::level::debug
               : args.quiet   ? spdlog::level::err
                              : spdlog::level::warn;
    // -V and -q win over the environment
    if (const char* env = std::getenv("REEL_LOG_LEVEL"); env && !args.verbose && !args.quiet) {
        level = reel::core::parse_log_level(env);
    }
    reel::core::init_logging(level);

    auto config = load_config(args);
    if (!config) {
        std::cerr << "Error: configuration: " << config.error().message() << std::endl;
        return 1;
    }

    if (args.resume) {
        auto result = resume(args, *config);
        return result ? *result : 1;
    }

    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.info) {
        for (const auto& url : args.urls) {
            auto result = info(url, *config);
            if (!result) {
                return 1;
            }
        }
        return 0;
    }

    auto result = download(args, *config);
    return result ? *result : 1;
}
