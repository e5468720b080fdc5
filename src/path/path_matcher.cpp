//
// hook-warden - Path Pattern Matching Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <path/path_matcher.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

#if !defined(_WIN32)
#include <pwd.h>
#include <unistd.h>
#endif

namespace hook_warden {

    namespace {

        constexpr std::string_view REGEX_METACHARACTERS = R"(\^$.|?*+()[]{})";

        constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

        auto is_separator(char c, Platform platform) -> bool {
            return c == '/' || (platform == Platform::windows && c == '\\');
        }

        auto is_name_start(char c) -> bool {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        auto is_name_char(char c) -> bool {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        //
        // Read a variable name ([A-Za-z_][A-Za-z0-9_]*) starting at pos.
        //
        auto read_name(std::string_view text, std::size_t pos) -> std::string_view {
            if (pos >= text.size() || !is_name_start(text[pos])) {
                return {};
            }

            auto end = pos + 1;
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }
            return text.substr(pos, end - pos);
        }

        auto is_valid_name(std::string_view name) -> bool {
            return !name.empty() && read_name(name, 0).size() == name.size();
        }

        auto env_value(std::string_view name) -> std::optional<std::string> {
            if (auto const* value = std::getenv(std::string{name}.c_str())) {
                return std::string{value};
            }
            return std::nullopt;
        }

        auto starts_with_icase(std::string_view text, std::string_view prefix) -> bool {
            if (text.size() < prefix.size()) {
                return false;
            }
            return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            });
        }

        auto to_lower(std::string str) -> std::string {
            std::ranges::transform(str, str.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return str;
        }

        //
        // Find the ']' closing a glob character class opened at pos.
        //
        // A ']' directly after "[" or "[!" is a class member, not the end.
        //
        auto find_class_end(std::string_view pattern, std::size_t open) -> std::size_t {
            auto pos = open + 1;
            if (pos < pattern.size() && (pattern[pos] == '!' || pattern[pos] == '^')) {
                ++pos;
            }
            if (pos < pattern.size() && pattern[pos] == ']') {
                ++pos;
            }
            return pattern.find(']', pos);
        }

        auto final_component(std::string const& normalized) -> std::string {
            auto slash = normalized.find_last_of('/');
            if (slash == std::string::npos) {
                return normalized;
            }
            return normalized.substr(slash + 1);
        }

        //
        // Compile a regex, returning nullopt for invalid syntax.
        //
        auto try_compile(std::string const& source) -> std::optional<std::regex> {
            try {
                return std::regex{source, REGEX_FLAGS};
            } catch (std::regex_error const&) {
                return std::nullopt;
            }
        }

    }  // anonymous namespace

    auto is_glob(std::string_view pattern) -> bool {
        return pattern.find_first_of("*?[") != std::string_view::npos;
    }

    auto classify_pattern(std::string text) -> PathPattern {
        auto kind = is_glob(text) ? PatternKind::glob : PatternKind::literal;
        return PathPattern{std::move(text), kind};
    }

    auto home_directory(Platform platform) -> std::optional<std::string> {
        if (platform == Platform::windows) {
            if (auto profile = env_value("USERPROFILE")) {
                return profile;
            }
            return env_value("HOME");
        }

        if (auto home = env_value("HOME")) {
            return home;
        }

#if !defined(_WIN32)
        if (auto const* pwd = getpwuid(getuid()); pwd && pwd->pw_dir) {
            return std::string{pwd->pw_dir};
        }
#endif
        return std::nullopt;
    }

    auto expand_path(std::string_view path, Platform platform) -> std::string {
        std::string result;
        result.reserve(path.size());
        std::size_t pos = 0;

        // Leading "~" or "~/..."
        if (!path.empty() && path[0] == '~' &&
            (path.size() == 1 || is_separator(path[1], platform))) {
            if (auto home = home_directory(platform)) {
                result = *home;
                pos = 1;
            }
        }

        while (pos < path.size()) {
            auto const c = path[pos];

            if (c == '$') {
                // $env:NAME (PowerShell)
                if (platform == Platform::windows &&
                    starts_with_icase(path.substr(pos + 1), "env:")) {
                    auto name = read_name(path, pos + 5);
                    if (auto value = env_value(name); !name.empty() && value) {
                        result += *value;
                        pos += 5 + name.size();
                        continue;
                    }
                }

                // ${NAME}
                if (pos + 1 < path.size() && path[pos + 1] == '{') {
                    auto close = path.find('}', pos + 2);
                    if (close != std::string_view::npos) {
                        auto name = path.substr(pos + 2, close - pos - 2);
                        if (auto value = env_value(name); is_valid_name(name) && value) {
                            result += *value;
                            pos = close + 1;
                            continue;
                        }
                    }
                } else {
                    // $NAME
                    auto name = read_name(path, pos + 1);
                    if (auto value = env_value(name); !name.empty() && value) {
                        result += *value;
                        pos += 1 + name.size();
                        continue;
                    }
                }
            } else if (c == '%' && platform == Platform::windows) {
                // %NAME%
                auto close = path.find('%', pos + 1);
                if (close != std::string_view::npos) {
                    auto name = path.substr(pos + 1, close - pos - 1);
                    if (auto value = env_value(name); is_valid_name(name) && value) {
                        result += *value;
                        pos = close + 1;
                        continue;
                    }
                }
            }

            result += c;
            ++pos;
        }

        return result;
    }

    auto normalize_path(std::string_view path, Platform platform) -> std::string {
        auto expanded = expand_path(path, platform);
        if (expanded.empty()) {
            return expanded;
        }

        if (platform == Platform::windows) {
            std::ranges::replace(expanded, '\\', '/');
        }

        auto normal = std::filesystem::path{expanded}.lexically_normal().generic_string();

        // Drop a trailing separator, keeping "/" and "c:/"
        auto is_drive_root = platform == Platform::windows && normal.size() == 3 &&
                             normal[1] == ':';
        while (normal.size() > 1 && normal.back() == '/' && !is_drive_root) {
            normal.pop_back();
        }

        if (platform == Platform::windows) {
            normal = to_lower(std::move(normal));
        }

        return normal;
    }

    auto escape_regex(std::string_view text) -> std::string {
        std::string result;
        result.reserve(text.size() * 2);
        for (auto const c : text) {
            if (REGEX_METACHARACTERS.find(c) != std::string_view::npos) {
                result += '\\';
            }
            result += c;
        }
        return result;
    }

    auto glob_to_regex(std::string_view pattern, Platform platform) -> std::string {
        std::string const path_char = platform == Platform::windows ? R"([^\s/\\])" : R"([^\s/])";

        std::string result;
        result.reserve(pattern.size() * 2);

        for (std::size_t i = 0; i < pattern.size(); ++i) {
            auto const c = pattern[i];

            switch (c) {
            case '*':
                result += path_char;
                result += '*';
                break;

            case '?':
                result += path_char;
                break;

            case '[': {
                auto close = find_class_end(pattern, i);
                if (close == std::string_view::npos) {
                    result += R"(\[)";
                    break;
                }

                result += '[';
                auto member = i + 1;
                if (pattern[member] == '!' || pattern[member] == '^') {
                    result += '^';
                    ++member;
                }
                for (; member < close; ++member) {
                    auto const m = pattern[member];
                    if (m == '\\' || m == '[' || m == ']' || m == '^') {
                        result += '\\';
                    }
                    result += m;
                }
                result += ']';
                i = close;
                break;
            }

            default:
                if (REGEX_METACHARACTERS.find(c) != std::string_view::npos) {
                    result += '\\';
                }
                result += c;
                break;
            }
        }

        return result;
    }

    auto match_literal(std::string_view candidate, std::string_view pattern,
                       Platform platform) -> bool {
        CompiledPathPattern compiled{PathPattern{std::string{pattern}, PatternKind::literal},
                                     platform};
        return compiled.matches(candidate);
    }

    auto match_glob(std::string_view candidate, std::string_view pattern,
                    Platform platform) -> bool {
        CompiledPathPattern compiled{PathPattern{std::string{pattern}, PatternKind::glob},
                                     platform};
        return compiled.matches(candidate);
    }

    auto matches_path(std::string_view candidate, PathPattern const& pattern,
                      Platform platform) -> bool {
        return CompiledPathPattern{pattern, platform}.matches(candidate);
    }

    CompiledPathPattern::CompiledPathPattern(PathPattern pattern, Platform platform)
        : m_pattern(std::move(pattern)), m_platform(platform) {

        if (m_pattern.kind == PatternKind::literal) {
            m_normalized = normalize_path(m_pattern.text, m_platform);
            return;
        }

        // Final-component matchers: as written, then expanded
        if (auto regex = try_compile(glob_to_regex(m_pattern.text, m_platform))) {
            m_component_regexes.push_back(std::move(*regex));
        }
        auto expanded = expand_path(m_pattern.text, m_platform);
        if (expanded != m_pattern.text) {
            if (auto regex = try_compile(glob_to_regex(expanded, m_platform))) {
                m_component_regexes.push_back(std::move(*regex));
            }
        }

        auto has_separator = std::ranges::any_of(m_pattern.text, [this](char c) {
            return is_separator(c, m_platform);
        });
        if (has_separator) {
            m_full_regex = try_compile(
                glob_to_regex(normalize_path(m_pattern.text, m_platform), m_platform));
        }
    }

    auto CompiledPathPattern::matches(std::string_view candidate) const -> bool {
        if (candidate.empty()) {
            return false;
        }

        auto normalized = normalize_path(candidate, m_platform);

        if (m_pattern.kind == PatternKind::literal) {
            return matches_literal(normalized);
        }
        return matches_glob(normalized);
    }

    auto CompiledPathPattern::matches_literal(std::string const& normalized) const -> bool {
        if (m_normalized.empty()) {
            return false;
        }

        if (normalized == m_normalized) {
            return true;
        }

        return normalized.size() > m_normalized.size() &&
               normalized.starts_with(m_normalized) &&
               (m_normalized.back() == '/' || normalized[m_normalized.size()] == '/');
    }

    auto CompiledPathPattern::matches_glob(std::string const& normalized) const -> bool {
        auto const component = final_component(normalized);

        for (auto const& regex : m_component_regexes) {
            if (std::regex_match(component, regex)) {
                return true;
            }
        }

        return m_full_regex && std::regex_match(normalized, *m_full_regex);
    }

}  // namespace hook_warden
