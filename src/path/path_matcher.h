//
// hook-warden - Path Pattern Matching
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_PATH_PATH_MATCHER_H
#define HOOK_WARDEN_PATH_PATH_MATCHER_H

#include <core/types.h>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace hook_warden {

    //
    // How a configured path pattern is compared against candidates.
    //
    enum class PatternKind : std::uint8_t {
        literal,  // Exact path or directory prefix
        glob      // Contains *, ? or [
    };

    //
    // A configured path pattern, classified once when it is loaded.
    //
    struct PathPattern {
        std::string text;                           // Pattern as written (e.g., "~/.ssh/*")
        PatternKind kind{PatternKind::literal};

        auto operator==(PathPattern const&) const -> bool = default;
    };

    //
    // Check if a pattern uses glob syntax (contains '*', '?' or '[').
    //
    [[nodiscard]] auto is_glob(std::string_view pattern) -> bool;

    //
    // Tag a pattern string as literal or glob.
    //
    [[nodiscard]] auto classify_pattern(std::string text) -> PathPattern;

    //
    // Resolve the current user's home directory.
    //
    // posix:   $HOME, falling back to the password database
    // windows: %USERPROFILE%, falling back to $HOME
    //
    [[nodiscard]] auto home_directory(Platform platform) -> std::optional<std::string>;

    //
    // Expand a leading '~' and environment variable references.
    //
    // All platforms recognize $VAR and ${VAR}; windows additionally
    // recognizes %VAR% and $env:VAR. References to undefined variables are
    // left as written.
    //
    [[nodiscard]] auto expand_path(std::string_view path, Platform platform) -> std::string;

    //
    // Expand, then lexically normalize a path for comparison.
    //
    // Postconditions:
    //   - Separators are '/', with no redundant separators, "." or ".."
    //     segments and no trailing separator (except for a root)
    //   - On windows the result is lower-cased
    //
    [[nodiscard]] auto normalize_path(std::string_view path, Platform platform) -> std::string;

    //
    // Escape every ECMAScript regex metacharacter in text.
    //
    [[nodiscard]] auto escape_regex(std::string_view text) -> std::string;

    //
    // Translate a glob into an (unanchored) ECMAScript regex fragment.
    //
    // '*' matches any run of characters other than whitespace and path
    // separators, '?' matches one such character, "[...]" is a character
    // class ("[!...]" negated). An unterminated '[' is taken literally and
    // all other metacharacters are escaped.
    //
    [[nodiscard]] auto glob_to_regex(std::string_view pattern, Platform platform) -> std::string;

    //
    // True if the normalized candidate equals the normalized pattern, or
    // lies beneath it (the prefix must end at a separator boundary).
    //
    [[nodiscard]] auto match_literal(std::string_view candidate,
                                     std::string_view pattern,
                                     Platform platform) -> bool;

    //
    // Case-insensitive glob match against the candidate's final component
    // and, when the pattern contains a separator, the full normalized path.
    //
    // A glob that cannot be compiled never matches.
    //
    [[nodiscard]] auto match_glob(std::string_view candidate,
                                  std::string_view pattern,
                                  Platform platform) -> bool;

    //
    // match_literal() or match_glob(), by the pattern's kind.
    //
    [[nodiscard]] auto matches_path(std::string_view candidate,
                                    PathPattern const& pattern,
                                    Platform platform) -> bool;

    //
    // A path pattern with its matcher prepared for one platform.
    //
    // Construction does all expansion, normalization and regex compilation,
    // so matches() only normalizes the candidate.
    //
    class CompiledPathPattern {
    public:
        CompiledPathPattern(PathPattern pattern, Platform platform);

        [[nodiscard]] auto matches(std::string_view candidate) const -> bool;

        [[nodiscard]] auto pattern() const -> PathPattern const& { return m_pattern; }

    private:
        [[nodiscard]] auto matches_literal(std::string const& normalized) const -> bool;
        [[nodiscard]] auto matches_glob(std::string const& normalized) const -> bool;

        PathPattern m_pattern;
        Platform m_platform;
        std::string m_normalized;                   // literal: normalized pattern
        std::vector<std::regex> m_component_regexes;  // glob: final component matchers
        std::optional<std::regex> m_full_regex;     // glob with separators: full path matcher
    };

}  // namespace hook_warden

#endif  // HOOK_WARDEN_PATH_PATH_MATCHER_H
