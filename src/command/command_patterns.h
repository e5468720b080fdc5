//
// hook-warden - Command Operation Patterns
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_COMMAND_COMMAND_PATTERNS_H
#define HOOK_WARDEN_COMMAND_COMMAND_PATTERNS_H

#include <core/types.h>
#include <path/path_matcher.h>

#include <array>
#include <cstddef>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hook_warden {

    //
    // Class of filesystem operation recognized in a command line.
    //
    enum class OperationClass : std::uint8_t {
        write,
        append,
        edit,
        move_copy,
        deletion,
        permission,
        truncate
    };

    inline constexpr std::size_t OPERATION_CLASS_COUNT = 7;

    //
    // Every modifying operation: what a read-only path forbids.
    //
    inline constexpr std::array<OperationClass, OPERATION_CLASS_COUNT> WRITE_CLASS_OPERATIONS{
        OperationClass::write,
        OperationClass::append,
        OperationClass::edit,
        OperationClass::move_copy,
        OperationClass::deletion,
        OperationClass::permission,
        OperationClass::truncate,
    };

    //
    // What a no-delete path forbids.
    //
    inline constexpr std::array<OperationClass, 1> DELETE_CLASS_OPERATIONS{
        OperationClass::deletion,
    };

    //
    // Placeholder replaced by the path regex fragment in a template.
    //
    inline constexpr std::string_view PATH_PLACEHOLDER = "{path}";

    //
    // One command-syntax template for an operation.
    //
    struct OperationTemplate {
        std::string_view regex;      // ECMAScript regex containing {path}
        std::string_view operation;  // Name reported on match (e.g., "delete", "chmod")
    };

    using OperationTemplates = std::span<OperationTemplate const>;

    //
    // Capability table: the templates of every operation class for one
    // platform.
    //
    struct OperationTable {
        Platform platform;
        std::array<OperationTemplates, OPERATION_CLASS_COUNT> templates;

        [[nodiscard]] constexpr auto operator[](OperationClass op) const -> OperationTemplates {
            return templates[static_cast<std::size_t>(op)];
        }
    };

    //
    // Get the operation table for a platform.
    //
    [[nodiscard]] auto operation_table(Platform platform) -> OperationTable const&;

    //
    // A template instantiated for one path pattern and compiled.
    //
    struct CompiledOperationRule {
        std::string operation;
        std::string source;   // Regex source, for diagnostics
        std::regex regex;
    };

    //
    // Result of compiling the rules for one path pattern.
    //
    // Templates that fail to compile are left out of rules and described in
    // errors; the remaining rules are still usable.
    //
    struct CompiledOperations {
        std::vector<CompiledOperationRule> rules;
        std::vector<std::string> errors;
    };

    //
    // Regex fragments standing for a path pattern inside a command line.
    //
    // literal: the escaped pattern as written and, when different, escaped
    //          after expansion (users may type either form)
    // glob:    the translated glob as written and, when different, after
    //          expansion
    //
    [[nodiscard]] auto path_fragments(PathPattern const& pattern, Platform platform)
        -> std::vector<std::string>;

    //
    // Instantiate and compile the templates of the given operation classes
    // for a path pattern, in class order then template order.
    //
    // Matching is case-insensitive.
    //
    [[nodiscard]] auto compile_operation_rules(PathPattern const& pattern,
                                               std::span<OperationClass const> classes,
                                               OperationTable const& table)
        -> CompiledOperations;

    [[nodiscard]] auto compile_operation_rules(PathPattern const& pattern,
                                               std::span<OperationClass const> classes,
                                               Platform platform)
        -> CompiledOperations;

    //
    // Compile bare "pattern appears anywhere in the command" matchers.
    //
    // The operation name of these rules is "reference".
    //
    [[nodiscard]] auto compile_reference_rules(PathPattern const& pattern, Platform platform)
        -> CompiledOperations;

    //
    // Scan a command against compiled rules in order.
    //
    // Returns the operation name of the first matching rule, or nullopt.
    //
    [[nodiscard]] auto match_any(std::string_view command,
                                 std::span<CompiledOperationRule const> rules)
        -> std::optional<std::string>;

    [[nodiscard]] auto to_string(OperationClass op) -> std::string;

}  // namespace hook_warden

#endif  // HOOK_WARDEN_COMMAND_COMMAND_PATTERNS_H
