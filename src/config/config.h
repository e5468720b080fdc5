//
// hook-warden - Rule Configuration
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_CONFIG_CONFIG_H
#define HOOK_WARDEN_CONFIG_CONFIG_H

#include <core/types.h>
#include <path/path_matcher.h>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hook_warden {

    //
    // Path-independent rule matched against the whole command text.
    //
    struct GenericRule {
        std::string pattern;  // ECMAScript regex, searched case-insensitively
        std::string reason;   // Shown to the user on Ask/Block
        bool ask{false};      // true: ask for confirmation, false: block
    };

    //
    // The four rule tiers.
    //
    // Order within each list is significant: the first matching entry of a
    // tier decides. A RuleConfig is treated as immutable once built.
    //
    struct RuleConfig {
        std::vector<GenericRule> generic_rules;
        std::vector<PathPattern> zero_access_paths;  // No reference at all, reads included
        std::vector<PathPattern> read_only_paths;    // No modifying operation
        std::vector<PathPattern> no_delete_paths;    // No deletion

        [[nodiscard]] auto empty() const -> bool {
            return generic_rules.empty() && zero_access_paths.empty() &&
                   read_only_paths.empty() && no_delete_paths.empty();
        }
    };

    //
    // Behavior of the hook executable.
    //
    struct HookSettings {
        bool fail_closed{false};    // Block everything when no rules could be loaded
        bool log_decisions{true};   // Log Ask/Block decisions to the journal
    };

    //
    // Contents of one rule file.
    //
    struct RuleFile {
        RuleConfig rules;
        HookSettings settings;
    };

    //
    // Rule files located for one invocation.
    //
    struct RuleSources {
        std::optional<std::filesystem::path> base;
        std::optional<std::filesystem::path> overlay;

        [[nodiscard]] auto found() const -> bool { return base.has_value() || overlay.has_value(); }
    };

    inline constexpr std::string_view BASE_RULE_FILE = "rules.toml";

    //
    // Combine a base rule set with an overlay.
    //
    // Postconditions:
    //   - Every field is base's list followed by overlay's list, relative
    //     order preserved
    //
    [[nodiscard]] auto merge_rules(RuleConfig const& base, RuleConfig const& overlay)
        -> RuleConfig;

    //
    // Parse rule file contents (TOML).
    //
    // Postconditions:
    //   - On success: returns the rules with every path pattern classified
    //   - On failure: returns error message (syntax or schema error)
    //
    // Regex syntax is not validated here; the policy engine skips rules
    // that fail to compile.
    //
    [[nodiscard]] auto parse_rule_file(std::string_view toml_text)
        -> std::expected<RuleFile, std::string>;

    //
    // Load a rule file from disk.
    //
    // Preconditions:
    //   - path must refer to a readable TOML file
    //
    [[nodiscard]] auto load_rule_file(std::filesystem::path const& path)
        -> std::expected<RuleFile, std::string>;

    //
    // Load a rule file, treating a missing file as an empty rule set.
    //
    // If the file exists but has errors, returns error.
    //
    [[nodiscard]] auto load_rule_file_or_empty(std::filesystem::path const& path)
        -> std::expected<RuleFile, std::string>;

    //
    // File name of the overlay for a platform (e.g., "rules.windows.toml").
    //
    [[nodiscard]] auto overlay_file_name(Platform platform) -> std::string;

    //
    // Directories searched for rule files, highest priority first:
    //   1. $HOOK_WARDEN_PROJECT_DIR/.hook-warden (or ./.hook-warden)
    //   2. $XDG_CONFIG_HOME/hook-warden (or ~/.config/hook-warden)
    //   3. /etc/hook-warden
    //
    [[nodiscard]] auto default_search_dirs() -> std::vector<std::filesystem::path>;

    //
    // Find the rule files for a platform.
    //
    // The first directory containing rules.toml supplies the base; the
    // platform overlay is taken from the same directory when present.
    //
    [[nodiscard]] auto discover_rule_files(std::vector<std::filesystem::path> const& search_dirs,
                                           Platform platform) -> RuleSources;

    //
    // Load and merge the located base and overlay.
    //
    // Postconditions:
    //   - On success: rules = merge_rules(base, overlay); settings come from
    //     the base file. No sources yields an empty RuleFile.
    //   - On failure: returns error message naming the file
    //
    [[nodiscard]] auto load_merged_rules(RuleSources const& sources)
        -> std::expected<RuleFile, std::string>;

}  // namespace hook_warden

#endif  // HOOK_WARDEN_CONFIG_CONFIG_H
