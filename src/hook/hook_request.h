//
// hook-warden - Tool Hook Protocol
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#ifndef HOOK_WARDEN_HOOK_HOOK_REQUEST_H
#define HOOK_WARDEN_HOOK_HOOK_REQUEST_H

#include <policy/decision.h>
#include <policy/policy_engine.h>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace hook_warden {

    //
    // Exit codes understood by the invoking assistant.
    //
    inline constexpr int EXIT_PROCEED = 0;      // Allow, or Ask with a payload on stdout
    inline constexpr int EXIT_HOOK_ERROR = 1;   // Non-blocking hook failure
    inline constexpr int EXIT_BLOCK = 2;        // Block, reason on stderr

    //
    // Longest command excerpt echoed back in a block message.
    //
    inline constexpr std::size_t MAX_COMMAND_EXCERPT = 100;

    //
    // What kind of input a tool carries.
    //
    enum class ToolKind : std::uint8_t {
        shell,      // tool_input.command
        file_edit,  // tool_input.file_path (notebook_path for notebooks)
        other       // Not policed
    };

    //
    // A pre-execution tool invocation request.
    //
    struct HookRequest {
        std::string tool_name;
        ToolKind kind{ToolKind::other};
        std::string command;     // Set for shell tools
        std::string file_path;   // Set for file edit tools
    };

    //
    // What the hook writes back to the invoking process.
    //
    struct HookResponse {
        int exit_code{EXIT_PROCEED};
        std::string stdout_payload;
        std::string stderr_message;
    };

    //
    // Map a tool name to the kind of input it carries.
    //
    // shell:     Bash, PowerShell
    // file_edit: Edit, MultiEdit, Write, NotebookEdit
    //
    [[nodiscard]] auto classify_tool(std::string_view tool_name) -> ToolKind;

    //
    // Parse the JSON request read from stdin.
    //
    // Expected shape: {"tool_name": "...", "tool_input": {...}}. Missing
    // input fields leave command/file_path empty.
    //
    // Postconditions:
    //   - On success: returns the request
    //   - On failure: returns error message (invalid JSON or field types)
    //
    [[nodiscard]] auto parse_hook_request(std::string_view json)
        -> std::expected<HookRequest, std::string>;

    //
    // Evaluate a request with the engine matching its tool kind.
    //
    // Tools of kind other are allowed.
    //
    [[nodiscard]] auto evaluate_request(HookRequest const& request, PolicyEngine const& engine)
        -> Decision;

    //
    // JSON payload asking the user to confirm a tool call.
    //
    [[nodiscard]] auto ask_payload(std::string_view reason) -> std::string;

    //
    // Map a decision to the hook protocol.
    //
    // Allow: exit 0, no output
    // Ask:   exit 0, ask_payload() on stdout
    // Block: exit 2, "SECURITY: Blocked: <reason>" and the offending
    //        command or file on stderr
    //
    [[nodiscard]] auto to_hook_response(HookRequest const& request, Decision const& decision)
        -> HookResponse;

}  // namespace hook_warden

#endif  // HOOK_WARDEN_HOOK_HOOK_REQUEST_H
