//
// hook-warden - Rule Configuration Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>

#include <platform/detector.h>

#include <hinder/exception/exception.h>

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <system_error>

namespace hook_warden {

    HINDER_DEFINE_EXCEPTION(config_error, hinder::generic_error);

    namespace {

        //
        // Extract optional value from TOML table with default.
        //
        template<typename T>
        auto get_or(toml::table const& table, std::string_view key, T default_value) -> T {
            if (auto opt = table[key].value<T>()) {
                return *opt;
            }
            return default_value;
        }

        //
        // Append vector b to a copy of vector a.
        //
        template<typename T>
        auto concat(std::vector<T> const& a, std::vector<T> const& b) -> std::vector<T> {
            std::vector<T> result;
            result.reserve(a.size() + b.size());
            result.insert(result.end(), a.begin(), a.end());
            result.insert(result.end(), b.begin(), b.end());
            return result;
        }

        //
        // Parse settings section.
        //
        auto parse_settings(toml::table const& root) -> HookSettings {
            HookSettings cfg;

            if (auto settings = root["settings"].as_table()) {
                cfg.fail_closed = get_or(*settings, "fail_closed", cfg.fail_closed);
                cfg.log_decisions = get_or(*settings, "log_decisions", cfg.log_decisions);
            }

            return cfg;
        }

        //
        // Parse a path pattern array, classifying each entry.
        //
        auto parse_pattern_array(toml::table const& paths, std::string_view key)
            -> std::vector<PathPattern> {
            std::vector<PathPattern> patterns;

            auto node = paths[key];
            if (!node) {
                return patterns;
            }

            auto const* arr = node.as_array();
            HINDER_EXPECTS(arr != nullptr, config_error)
                .message("paths.{} must be an array of strings", key);

            std::size_t index = 0;
            for (auto const& elem : *arr) {
                auto str = elem.value<std::string>();
                HINDER_EXPECTS(str.has_value(), config_error)
                    .message("paths.{}[{}] must be a string", key, index);

                if (!str->empty()) {
                    patterns.push_back(classify_pattern(*str));
                }
                ++index;
            }

            return patterns;
        }

        //
        // Parse [paths] section.
        //
        void parse_paths(toml::table const& root, RuleConfig& cfg) {
            auto const* paths = root["paths"].as_table();
            if (!paths) {
                return;
            }

            cfg.zero_access_paths = parse_pattern_array(*paths, "zero_access");
            cfg.read_only_paths = parse_pattern_array(*paths, "read_only");
            cfg.no_delete_paths = parse_pattern_array(*paths, "no_delete");
        }

        //
        // Parse [[generic_rules]] array.
        //
        auto parse_generic_rules(toml::table const& root) -> std::vector<GenericRule> {
            std::vector<GenericRule> rules;

            auto node = root["generic_rules"];
            if (!node) {
                return rules;
            }

            auto const* arr = node.as_array();
            HINDER_EXPECTS(arr != nullptr, config_error)
                .message("generic_rules must be an array of tables");

            std::size_t index = 0;
            for (auto const& elem : *arr) {
                auto const* rule_table = elem.as_table();
                HINDER_EXPECTS(rule_table != nullptr, config_error)
                    .message("generic_rules[{}] must be a table", index);

                auto pattern = (*rule_table)["pattern"].value<std::string>();
                HINDER_EXPECTS(pattern.has_value() && !pattern->empty(), config_error)
                    .message("generic_rules[{}]: missing required key: pattern", index);

                GenericRule rule;
                rule.pattern = *pattern;
                rule.reason = get_or(*rule_table, "reason",
                                     std::format("command matches {}", rule.pattern));
                rule.ask = get_or(*rule_table, "ask", rule.ask);

                rules.push_back(std::move(rule));
                ++index;
            }

            return rules;
        }

        auto parse_root(toml::table const& root) -> RuleFile {
            RuleFile file;
            file.settings = parse_settings(root);
            file.rules.generic_rules = parse_generic_rules(root);
            parse_paths(root, file.rules);
            return file;
        }

        auto env_path(char const* name) -> std::optional<std::filesystem::path> {
            if (auto const* value = std::getenv(name); value && *value != '\0') {
                return std::filesystem::path{value};
            }
            return std::nullopt;
        }

    }  // anonymous namespace

    auto merge_rules(RuleConfig const& base, RuleConfig const& overlay) -> RuleConfig {
        RuleConfig merged;
        merged.generic_rules = concat(base.generic_rules, overlay.generic_rules);
        merged.zero_access_paths = concat(base.zero_access_paths, overlay.zero_access_paths);
        merged.read_only_paths = concat(base.read_only_paths, overlay.read_only_paths);
        merged.no_delete_paths = concat(base.no_delete_paths, overlay.no_delete_paths);
        return merged;
    }

    auto parse_rule_file(std::string_view toml_text) -> std::expected<RuleFile, std::string> {
        try {
            return parse_root(toml::parse(toml_text));
        }
        catch (toml::parse_error const& e) {
            return std::unexpected(std::format("TOML parse error: {} (line {})",
                                               e.description(), e.source().begin.line));
        }
        catch (config_error const& e) {
            return std::unexpected(std::format("Config error: {}", e.what()));
        }
        catch (std::exception const& e) {
            return std::unexpected(std::format("Unexpected error parsing rules: {}", e.what()));
        }
    }

    auto load_rule_file(std::filesystem::path const& path)
        -> std::expected<RuleFile, std::string> {

        try {
            return parse_root(toml::parse_file(path.string()));
        }
        catch (toml::parse_error const& e) {
            return std::unexpected(std::format("{}: TOML parse error: {} (line {})",
                                               path.string(), e.description(),
                                               e.source().begin.line));
        }
        catch (config_error const& e) {
            return std::unexpected(std::format("{}: Config error: {}", path.string(), e.what()));
        }
        catch (std::exception const& e) {
            return std::unexpected(std::format("{}: Unexpected error loading rules: {}",
                                               path.string(), e.what()));
        }
    }

    auto load_rule_file_or_empty(std::filesystem::path const& path)
        -> std::expected<RuleFile, std::string> {

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return RuleFile{};
        }

        return load_rule_file(path);
    }

    auto overlay_file_name(Platform platform) -> std::string {
        return std::format("rules.{}.toml", to_string(platform));
    }

    auto default_search_dirs() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> dirs;

        // Project directory
        if (auto project = env_path("HOOK_WARDEN_PROJECT_DIR")) {
            dirs.push_back(*project / ".hook-warden");
        } else {
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            if (!ec) {
                dirs.push_back(cwd / ".hook-warden");
            }
        }

        // User configuration
        if (auto xdg = env_path("XDG_CONFIG_HOME")) {
            dirs.push_back(*xdg / "hook-warden");
        } else if (auto home = home_directory(host_platform())) {
            dirs.push_back(std::filesystem::path{*home} / ".config" / "hook-warden");
        }

        // System configuration
        dirs.emplace_back("/etc/hook-warden");

        return dirs;
    }

    auto discover_rule_files(std::vector<std::filesystem::path> const& search_dirs,
                             Platform platform) -> RuleSources {
        RuleSources sources;
        std::error_code ec;

        for (auto const& dir : search_dirs) {
            auto base = dir / BASE_RULE_FILE;
            if (!std::filesystem::is_regular_file(base, ec)) {
                continue;
            }

            sources.base = base;

            auto overlay = dir / overlay_file_name(platform);
            if (std::filesystem::is_regular_file(overlay, ec)) {
                sources.overlay = overlay;
            }
            break;
        }

        return sources;
    }

    auto load_merged_rules(RuleSources const& sources) -> std::expected<RuleFile, std::string> {
        RuleFile merged;

        if (sources.base) {
            auto base = load_rule_file(*sources.base);
            if (!base) {
                return std::unexpected(base.error());
            }
            merged = std::move(*base);
        }

        if (sources.overlay) {
            auto overlay = load_rule_file(*sources.overlay);
            if (!overlay) {
                return std::unexpected(overlay.error());
            }
            merged.rules = merge_rules(merged.rules, overlay->rules);
        }

        return merged;
    }

}  // namespace hook_warden
