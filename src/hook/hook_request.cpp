//
// hook-warden - Tool Hook Protocol Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <hook/hook_request.h>

#include <nlohmann/json.hpp>

#include <format>
#include <type_traits>

namespace hook_warden {

    using nlohmann::json;

    namespace {

        //
        // Read a string member, treating absent or null as empty.
        //
        auto string_field(json const& object, char const* key) -> std::string {
            auto it = object.find(key);
            if (it == object.end() || it->is_null()) {
                return {};
            }
            return it->get<std::string>();
        }

        auto excerpt(std::string const& text) -> std::string {
            if (text.size() <= MAX_COMMAND_EXCERPT) {
                return text;
            }
            return text.substr(0, MAX_COMMAND_EXCERPT) + "...";
        }

    }  // anonymous namespace

    auto classify_tool(std::string_view tool_name) -> ToolKind {
        if (tool_name == "Bash" || tool_name == "PowerShell") {
            return ToolKind::shell;
        }
        if (tool_name == "Edit" || tool_name == "MultiEdit" || tool_name == "Write" ||
            tool_name == "NotebookEdit") {
            return ToolKind::file_edit;
        }
        return ToolKind::other;
    }

    auto parse_hook_request(std::string_view text) -> std::expected<HookRequest, std::string> {
        try {
            auto root = json::parse(text);
            if (!root.is_object()) {
                return std::unexpected("Invalid hook request: expected a JSON object");
            }

            HookRequest request;
            request.tool_name = string_field(root, "tool_name");
            request.kind = classify_tool(request.tool_name);

            auto input = root.find("tool_input");
            if (input == root.end() || !input->is_object()) {
                return request;
            }

            switch (request.kind) {
            case ToolKind::shell:
                request.command = string_field(*input, "command");
                break;

            case ToolKind::file_edit:
                request.file_path = string_field(*input, "file_path");
                if (request.file_path.empty()) {
                    request.file_path = string_field(*input, "notebook_path");
                }
                break;

            case ToolKind::other:
                break;
            }

            return request;
        }
        catch (json::parse_error const& e) {
            return std::unexpected(std::format("Invalid JSON in hook request: {}", e.what()));
        }
        catch (json::exception const& e) {
            return std::unexpected(std::format("Invalid hook request: {}", e.what()));
        }
    }

    auto evaluate_request(HookRequest const& request, PolicyEngine const& engine) -> Decision {
        switch (request.kind) {
            case ToolKind::shell:
                return engine.evaluate_command(request.command);
            case ToolKind::file_edit:
                return engine.evaluate_path_edit(request.file_path);
            case ToolKind::other:
                return Allow{};
        }
        return Allow{};
    }

    auto ask_payload(std::string_view reason) -> std::string {
        json payload = {
            {"hookSpecificOutput", {
                {"hookEventName", "PreToolUse"},
                {"permissionDecision", "ask"},
                {"permissionDecisionReason", std::string{reason}}
            }}
        };
        return payload.dump();
    }

    auto to_hook_response(HookRequest const& request, Decision const& decision) -> HookResponse {
        return std::visit([&](auto const& alternative) -> HookResponse {
            using T = std::decay_t<decltype(alternative)>;

            if constexpr (std::is_same_v<T, Allow>) {
                return HookResponse{};
            } else if constexpr (std::is_same_v<T, Ask>) {
                return HookResponse{
                    .exit_code = EXIT_PROCEED,
                    .stdout_payload = ask_payload(alternative.reason),
                    .stderr_message = {}
                };
            } else {
                auto message = std::format("SECURITY: Blocked: {}\n", alternative.reason);
                if (request.kind == ToolKind::shell) {
                    message += std::format("Command: {}\n", excerpt(request.command));
                } else if (request.kind == ToolKind::file_edit) {
                    message += std::format("File: {}\n", request.file_path);
                }
                return HookResponse{
                    .exit_code = EXIT_BLOCK,
                    .stdout_payload = {},
                    .stderr_message = std::move(message)
                };
            }
        }, decision);
    }

}  // namespace hook_warden
