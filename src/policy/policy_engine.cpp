//
// hook-warden - Policy Engine Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <policy/policy_engine.h>

#include <format>

namespace hook_warden {

    namespace {

        constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

        auto zero_access_reason(std::string const& pattern) -> std::string {
            return std::format("zero-access path {} (no operations allowed)", pattern);
        }

    }  // anonymous namespace

    PolicyEngine::PolicyEngine(RuleConfig const& config, Platform platform)
        : m_platform(platform) {

        for (auto const& rule : config.generic_rules) {
            try {
                m_generic_rules.push_back(CompiledGenericRule{
                    .rule = rule,
                    .regex = std::regex{rule.pattern, REGEX_FLAGS}
                });
            } catch (std::regex_error const& e) {
                m_warnings.push_back(std::format("Skipping generic rule {}: {}",
                                                 rule.pattern, e.what()));
            }
        }

        m_zero_access = compile_zero_access(config.zero_access_paths);
        m_read_only = compile_tier(config.read_only_paths, WRITE_CLASS_OPERATIONS);
        m_no_delete = compile_tier(config.no_delete_paths, DELETE_CLASS_OPERATIONS);
    }

    auto PolicyEngine::evaluate_command(std::string_view command) const -> Decision {
        if (command.empty()) {
            return Allow{};
        }

        // Generic rules first: path-independent policy overrides the path tiers
        for (auto const& generic : m_generic_rules) {
            if (std::regex_search(command.begin(), command.end(), generic.regex)) {
                if (generic.rule.ask) {
                    return Ask{generic.rule.reason};
                }
                return Block{generic.rule.reason, std::nullopt, generic.rule.pattern};
            }
        }

        for (auto const& entry : m_zero_access) {
            if (match_any(command, entry.command_rules)) {
                auto const& pattern = entry.path.pattern().text;
                return Block{zero_access_reason(pattern), std::nullopt, pattern};
            }
        }

        for (auto const& entry : m_read_only) {
            if (auto op = match_any(command, entry.command_rules)) {
                auto const& pattern = entry.path.pattern().text;
                return Block{std::format("{} operation on read-only path {}", *op, pattern),
                             op, pattern};
            }
        }

        for (auto const& entry : m_no_delete) {
            if (auto op = match_any(command, entry.command_rules)) {
                auto const& pattern = entry.path.pattern().text;
                return Block{std::format("{} operation on no-delete path {}", *op, pattern),
                             op, pattern};
            }
        }

        return Allow{};
    }

    auto PolicyEngine::evaluate_path_edit(std::string_view path) const -> Decision {
        if (path.empty()) {
            return Allow{};
        }

        for (auto const& entry : m_zero_access) {
            if (entry.path.matches(path)) {
                auto const& pattern = entry.path.pattern().text;
                return Block{zero_access_reason(pattern), std::nullopt, pattern};
            }
        }

        for (auto const& entry : m_read_only) {
            if (entry.path.matches(path)) {
                auto const& pattern = entry.path.pattern().text;
                return Block{std::format("read-only path {}", pattern), std::nullopt, pattern};
            }
        }

        return Allow{};
    }

    auto PolicyEngine::compile_tier(std::vector<PathPattern> const& patterns,
                                    std::span<OperationClass const> classes)
        -> std::vector<PathTierEntry> {
        auto const& table = operation_table(m_platform);

        std::vector<PathTierEntry> entries;
        entries.reserve(patterns.size());

        for (auto const& pattern : patterns) {
            auto compiled = compile_operation_rules(pattern, classes, table);
            keep_errors(compiled.errors);
            entries.push_back(PathTierEntry{
                .path = CompiledPathPattern{pattern, m_platform},
                .command_rules = std::move(compiled.rules)
            });
        }

        return entries;
    }

    auto PolicyEngine::compile_zero_access(std::vector<PathPattern> const& patterns)
        -> std::vector<PathTierEntry> {
        std::vector<PathTierEntry> entries;
        entries.reserve(patterns.size());

        for (auto const& pattern : patterns) {
            auto compiled = compile_reference_rules(pattern, m_platform);
            keep_errors(compiled.errors);
            entries.push_back(PathTierEntry{
                .path = CompiledPathPattern{pattern, m_platform},
                .command_rules = std::move(compiled.rules)
            });
        }

        return entries;
    }

    void PolicyEngine::keep_errors(std::vector<std::string> const& errors) {
        m_warnings.insert(m_warnings.end(), errors.begin(), errors.end());
    }

    auto evaluate_command(std::string_view command, RuleConfig const& config,
                          Platform platform) -> Decision {
        if (command.empty()) {
            return Allow{};
        }
        return PolicyEngine{config, platform}.evaluate_command(command);
    }

    auto evaluate_path_edit(std::string_view path, RuleConfig const& config,
                            Platform platform) -> Decision {
        if (path.empty()) {
            return Allow{};
        }
        return PolicyEngine{config, platform}.evaluate_path_edit(path);
    }

}  // namespace hook_warden
