//
// hook-warden - Policy Engine
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_POLICY_POLICY_ENGINE_H
#define HOOK_WARDEN_POLICY_POLICY_ENGINE_H

#include <command/command_patterns.h>
#include <config/config.h>
#include <core/types.h>
#include <path/path_matcher.h>
#include <platform/detector.h>
#include <policy/decision.h>

#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hook_warden {

    //
    // Policy engine for evaluating commands and file edits against a rule
    // configuration.
    //
    // Tiers are evaluated in a fixed order, and the first matching entry of
    // a tier decides:
    // 1. Generic rules (command text regex, ask or block)
    // 2. Zero-access paths (any reference blocks)
    // 3. Read-only paths (any modifying operation blocks)
    // 4. No-delete paths (deletion blocks)
    //
    // Every pattern is compiled once, for one platform, at construction.
    // A rule that fails to compile is skipped and described in warnings().
    // The engine is immutable afterwards, so concurrent evaluation on one
    // instance is safe.
    //
    // Command matching is a text heuristic, not a shell parse: quoting,
    // variable indirection or command substitution can hide a path from it.
    //
    class PolicyEngine {
    public:
        explicit PolicyEngine(RuleConfig const& config, Platform platform = host_platform());

        //
        // Evaluate a shell command.
        //
        // An empty command is allowed.
        //
        [[nodiscard]] auto evaluate_command(std::string_view command) const -> Decision;

        //
        // Evaluate a direct edit of a file path (zero-access and read-only
        // tiers only, no operation parsing).
        //
        // An empty path is allowed.
        //
        [[nodiscard]] auto evaluate_path_edit(std::string_view path) const -> Decision;

        [[nodiscard]] auto platform() const -> Platform { return m_platform; }

        //
        // Descriptions of rules skipped because they failed to compile.
        //
        [[nodiscard]] auto warnings() const -> std::vector<std::string> const& { return m_warnings; }

    private:
        struct CompiledGenericRule {
            GenericRule rule;
            std::regex regex;
        };

        //
        // One path pattern with its command matchers and edit matcher.
        //
        struct PathTierEntry {
            CompiledPathPattern path;
            std::vector<CompiledOperationRule> command_rules;
        };

        [[nodiscard]] auto compile_tier(std::vector<PathPattern> const& patterns,
                                        std::span<OperationClass const> classes)
            -> std::vector<PathTierEntry>;

        [[nodiscard]] auto compile_zero_access(std::vector<PathPattern> const& patterns)
            -> std::vector<PathTierEntry>;

        void keep_errors(std::vector<std::string> const& errors);

        Platform m_platform;
        std::vector<CompiledGenericRule> m_generic_rules;
        std::vector<PathTierEntry> m_zero_access;
        std::vector<PathTierEntry> m_read_only;
        std::vector<PathTierEntry> m_no_delete;
        std::vector<std::string> m_warnings;
    };

    //
    // Evaluate a shell command against a configuration.
    //
    // Equivalent to PolicyEngine{config, platform}.evaluate_command(command);
    // prefer a long-lived PolicyEngine when evaluating repeatedly.
    //
    [[nodiscard]] auto evaluate_command(std::string_view command,
                                        RuleConfig const& config,
                                        Platform platform) -> Decision;

    //
    // Evaluate a direct file edit against a configuration.
    //
    [[nodiscard]] auto evaluate_path_edit(std::string_view path,
                                          RuleConfig const& config,
                                          Platform platform) -> Decision;

}  // namespace hook_warden

#endif  // HOOK_WARDEN_POLICY_POLICY_ENGINE_H
