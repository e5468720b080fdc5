//
// hook-warden - Policy Decision
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_POLICY_DECISION_H
#define HOOK_WARDEN_POLICY_DECISION_H

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hook_warden {

    struct Allow {
        auto operator==(Allow const&) const -> bool = default;
    };

    struct Ask {
        std::string reason;

        auto operator==(Ask const&) const -> bool = default;
    };

    struct Block {
        std::string reason;                      // Full human-readable reason
        std::optional<std::string> operation;    // Triggering operation (e.g., "delete"), if any
        std::string pattern;                     // Path pattern or generic rule regex

        auto operator==(Block const&) const -> bool = default;
    };

    //
    // Outcome of evaluating one command or edit: exactly one of Allow,
    // Ask or Block.
    //
    using Decision = std::variant<Allow, Ask, Block>;

    [[nodiscard]] inline auto is_allow(Decision const& d) -> bool {
        return std::holds_alternative<Allow>(d);
    }

    [[nodiscard]] inline auto is_ask(Decision const& d) -> bool {
        return std::holds_alternative<Ask>(d);
    }

    [[nodiscard]] inline auto is_block(Decision const& d) -> bool {
        return std::holds_alternative<Block>(d);
    }

    //
    // Reason carried by an Ask or Block; empty for Allow.
    //
    [[nodiscard]] auto reason(Decision const& d) -> std::string_view;

    //
    // Render a decision for logs (e.g., "block: delete operation on ...").
    //
    [[nodiscard]] auto to_string(Decision const& d) -> std::string;

}  // namespace hook_warden

#endif  // HOOK_WARDEN_POLICY_DECISION_H
