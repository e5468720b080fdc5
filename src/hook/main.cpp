//
// hook-warden - Pre-execution Tool Policy Hook
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>
#include <hook/hook_request.h>
#include <platform/detector.h>
#include <policy/policy_engine.h>

#include <systemd/sd-journal.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {
    void print_usage(char const* program_name) {
        std::cout << "Usage: " << program_name << " [OPTIONS] < request.json\n"
                  << "\n"
                  << "Pre-execution policy hook for AI coding assistant tool calls.\n"
                  << "Reads one tool request from stdin; exits 0 to allow (or ask),\n"
                  << "2 to block.\n"
                  << "\n"
                  << "Options:\n"
                  << "  -c, --config PATH    Base rule file (default: search for rules.toml)\n"
                  << "      --overlay PATH   Platform overlay rule file\n"
                  << "                       (default: rules.<platform>.toml beside the base)\n"
                  << "      --platform NAME  Command syntax to enforce: posix or windows\n"
                  << "                       (default: detected)\n"
                  << "      --fail-closed    Block every call when no rules can be loaded\n"
                  << "  -h, --help           Show this help message\n"
                  << "  -v, --version        Show version information\n"
                  << "\n";
    }

    void print_version() {
        std::cout << "hook-warden 0.1.0\n"
                  << "Copyright (c) 2026 Tony Walker\n"
                  << "License: GPL-3.0-or-later\n";
    }

    void log_warning(std::string const& message) {
        std::cerr << "hook-warden: " << message << "\n";
        sd_journal_print(LOG_WARNING, "hook-warden: %s", message.c_str());
    }
}

auto main(int argc, char* argv[]) -> int {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> overlay_path;
    std::optional<std::string> platform_name;
    bool fail_closed = false;

    // Parse command-line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return EXIT_SUCCESS;
        } else if (arg == "--fail-closed") {
            fail_closed = true;
        } else if (arg == "-c" || arg == "--config" || arg == "--overlay" || arg == "--platform") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument\n";
                print_usage(argv[0]);
                return hook_warden::EXIT_HOOK_ERROR;
            }
            std::string value = argv[++i];
            if (arg == "--overlay") {
                overlay_path = value;
            } else if (arg == "--platform") {
                platform_name = value;
            } else {
                config_path = value;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return hook_warden::EXIT_HOOK_ERROR;
        }
    }

    try {
        using namespace hook_warden;

        auto platform = platform_name ? string_to_platform(*platform_name) : detect_platform();
        if (!platform) {
            std::cerr << "Error: " << platform.error() << "\n";
            return EXIT_HOOK_ERROR;
        }

        // Locate rule files
        RuleSources sources;
        if (config_path) {
            sources.base = *config_path;
            auto sibling = config_path->parent_path() / overlay_file_name(*platform);
            std::error_code ec;
            if (!overlay_path && std::filesystem::is_regular_file(sibling, ec)) {
                sources.overlay = sibling;
            }
        } else {
            sources = discover_rule_files(default_search_dirs(), *platform);
        }
        if (overlay_path) {
            sources.overlay = *overlay_path;
        }

        bool rules_available = sources.found();
        if (!rules_available) {
            log_warning("No rule files found");
        }

        RuleFile rules;
        if (rules_available) {
            auto loaded = load_merged_rules(sources);
            if (loaded) {
                rules = std::move(*loaded);
            } else {
                log_warning(loaded.error());
                rules_available = false;
            }
        }
        fail_closed = fail_closed || rules.settings.fail_closed;

        std::string input{std::istreambuf_iterator<char>{std::cin},
                          std::istreambuf_iterator<char>{}};
        auto request = parse_hook_request(input);
        if (!request) {
            std::cerr << "Error: " << request.error() << "\n";
            sd_journal_print(LOG_ERR, "hook-warden: %s", request.error().c_str());
            return EXIT_HOOK_ERROR;
        }

        if (!rules_available) {
            if (fail_closed) {
                std::cerr << "SECURITY: Blocked: no rule configuration could be loaded "
                             "(fail-closed)\n";
                sd_journal_print(LOG_WARNING, "hook-warden: blocked %s: no rules (fail-closed)",
                                 request->tool_name.c_str());
                return EXIT_BLOCK;
            }
            log_warning("Running without rules, all tool calls are allowed");
        }

        PolicyEngine engine{rules.rules, *platform};
        for (auto const& warning : engine.warnings()) {
            log_warning(warning);
        }

        auto decision = evaluate_request(*request, engine);
        auto response = to_hook_response(*request, decision);

        if (rules.settings.log_decisions && !is_allow(decision)) {
            sd_journal_print(is_block(decision) ? LOG_NOTICE : LOG_INFO,
                             "hook-warden: %s %s",
                             request->tool_name.c_str(), to_string(decision).c_str());
        }

        std::cout << response.stdout_payload;
        std::cerr << response.stderr_message;
        return response.exit_code;

    } catch (std::exception const& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        sd_journal_print(LOG_CRIT, "hook-warden: Fatal error: %s", e.what());
        return hook_warden::EXIT_HOOK_ERROR;
    }
}
