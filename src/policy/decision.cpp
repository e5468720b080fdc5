//
// hook-warden - Policy Decision Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <policy/decision.h>

#include <format>
#include <type_traits>

namespace hook_warden {

    auto reason(Decision const& d) -> std::string_view {
        return std::visit([](auto const& alternative) -> std::string_view {
            using T = std::decay_t<decltype(alternative)>;

            if constexpr (std::is_same_v<T, Allow>) {
                return {};
            } else {
                return alternative.reason;
            }
        }, d);
    }

    auto to_string(Decision const& d) -> std::string {
        return std::visit([](auto const& alternative) -> std::string {
            using T = std::decay_t<decltype(alternative)>;

            if constexpr (std::is_same_v<T, Allow>) {
                return "allow";
            } else if constexpr (std::is_same_v<T, Ask>) {
                return std::format("ask: {}", alternative.reason);
            } else {
                return std::format("block: {}", alternative.reason);
            }
        }, d);
    }

}  // namespace hook_warden
