//
// hook-warden - Core Types
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_CORE_TYPES_H
#define HOOK_WARDEN_CORE_TYPES_H

#include <cstdint>

namespace hook_warden {

    //
    // Command-syntax family used when matching paths and operations.
    //
    // The platform decides which operation tables apply, which variable
    // reference syntax is expanded, which path separators are recognized,
    // and whether path comparison is case-insensitive.
    //
    enum class Platform : std::uint8_t {
        posix,    // Linux, macOS, BSD shells
        windows   // cmd.exe / PowerShell
    };

}  // namespace hook_warden

#endif  // HOOK_WARDEN_CORE_TYPES_H
