//
// hook-warden - Platform Detection Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <platform/detector.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>

namespace hook_warden {

    namespace {

        //
        // Lower-case an ASCII string.
        //
        auto to_lower(std::string_view str) -> std::string {
            std::string result{str};
            std::ranges::transform(result, result.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return result;
        }

    }  // anonymous namespace

    auto is_windows_environment() -> bool {
        if (auto const* os = std::getenv("OS"); os && std::string_view{os} == "Windows_NT") {
            return true;
        }

        auto const* ostype = std::getenv("OSTYPE");
        if (!ostype) {
            return false;
        }

        auto const value = to_lower(ostype);
        return value.starts_with("msys") || value.starts_with("cygwin") ||
               value.starts_with("win32");
    }

    auto detect_platform() -> std::expected<Platform, std::string> {
        if (auto const* forced = std::getenv(PLATFORM_ENV); forced && *forced != '\0') {
            auto result = string_to_platform(forced);
            if (!result) {
                return std::unexpected(std::format("{}: {}", PLATFORM_ENV, result.error()));
            }
            return *result;
        }

        if (is_windows_environment()) {
            return Platform::windows;
        }

        return host_platform();
    }

    auto to_string(Platform platform) -> std::string {
        switch (platform) {
            case Platform::posix:
                return "posix";
            case Platform::windows:
                return "windows";
        }
        return "unknown";
    }

    auto string_to_platform(std::string_view str) -> std::expected<Platform, std::string> {
        auto const value = to_lower(str);

        if (value == "posix" || value == "linux" || value == "darwin" || value == "macos") {
            return Platform::posix;
        }
        if (value == "windows" || value == "win32" || value == "nt") {
            return Platform::windows;
        }

        return std::unexpected(std::format("Unknown platform: {}", str));
    }

}  // namespace hook_warden
