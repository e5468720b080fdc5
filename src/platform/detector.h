//
// hook-warden - Platform Detection
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_PLATFORM_DETECTOR_H
#define HOOK_WARDEN_PLATFORM_DETECTOR_H

#include <core/types.h>

#include <expected>
#include <string>
#include <string_view>

namespace hook_warden {

    //
    // Environment variable that forces the detected platform.
    //
    inline constexpr char const* PLATFORM_ENV = "HOOK_WARDEN_PLATFORM";

    //
    // Platform this binary was compiled for.
    //
    [[nodiscard]] constexpr auto host_platform() -> Platform {
#if defined(_WIN32)
        return Platform::windows;
#else
        return Platform::posix;
#endif
    }

    //
    // Check whether the process environment looks like a Windows shell
    // session (OS=Windows_NT, or an MSYS/Cygwin OSTYPE).
    //
    [[nodiscard]] auto is_windows_environment() -> bool;

    //
    // Detect the platform whose command syntax should be enforced.
    //
    // Detection strategy:
    // 1. HOOK_WARDEN_PLATFORM, if set, wins
    // 2. A Windows shell environment selects windows
    // 3. Otherwise: host_platform()
    //
    // Postconditions:
    //   - On success: returns the platform
    //   - On failure: returns error message (invalid override value)
    //
    [[nodiscard]] auto detect_platform() -> std::expected<Platform, std::string>;

    //
    // Convert between Platform enum and string representation.
    //
    [[nodiscard]] auto to_string(Platform platform) -> std::string;

    [[nodiscard]] auto string_to_platform(std::string_view str)
        -> std::expected<Platform, std::string>;

}  // namespace hook_warden

#endif  // HOOK_WARDEN_PLATFORM_DETECTOR_H
