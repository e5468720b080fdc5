//
// hook-warden - Command Operation Patterns Implementation
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <command/command_patterns.h>

#include <format>

namespace hook_warden {

    namespace {

        constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

        //
        // POSIX shells
        //

        constexpr std::array POSIX_WRITE{
            OperationTemplate{R"(>\s*{path})", "write"},
            OperationTemplate{R"(\btee\s+(?!.*-a).*{path})", "write"},
        };

        constexpr std::array POSIX_APPEND{
            OperationTemplate{R"(>>\s*{path})", "append"},
            OperationTemplate{R"(\btee\s+-a\s+.*{path})", "append"},
            OperationTemplate{R"(\btee\s+.*-a.*{path})", "append"},
        };

        constexpr std::array POSIX_EDIT{
            OperationTemplate{R"(\bsed\s+-i.*{path})", "edit"},
            OperationTemplate{R"(\bperl\s+-[^\s]*i.*{path})", "edit"},
            OperationTemplate{R"(\bawk\s+-i\s+inplace.*{path})", "edit"},
        };

        constexpr std::array POSIX_MOVE_COPY{
            OperationTemplate{R"(\bmv\s+.*\s+{path})", "move"},
            OperationTemplate{R"(\bcp\s+.*\s+{path})", "copy"},
        };

        constexpr std::array POSIX_DELETE{
            OperationTemplate{R"(\brm\s+.*{path})", "delete"},
            OperationTemplate{R"(\bunlink\s+.*{path})", "delete"},
            OperationTemplate{R"(\brmdir\s+.*{path})", "delete"},
            OperationTemplate{R"(\bshred\s+.*{path})", "delete"},
        };

        constexpr std::array POSIX_PERMISSION{
            OperationTemplate{R"(\bchmod\s+.*{path})", "chmod"},
            OperationTemplate{R"(\bchown\s+.*{path})", "chown"},
            OperationTemplate{R"(\bchgrp\s+.*{path})", "chgrp"},
        };

        constexpr std::array POSIX_TRUNCATE{
            OperationTemplate{R"(\btruncate\s+.*{path})", "truncate"},
            OperationTemplate{R"(:\s*>\s*{path})", "truncate"},
        };

        //
        // cmd.exe and PowerShell
        //

        constexpr std::array WINDOWS_WRITE{
            OperationTemplate{R"(>\s*{path})", "write"},
            OperationTemplate{R"(\bSet-Content\b.*{path})", "write"},
            OperationTemplate{R"(\bOut-File\b(?!.*-Append).*{path})", "write"},
        };

        constexpr std::array WINDOWS_APPEND{
            OperationTemplate{R"(>>\s*{path})", "append"},
            OperationTemplate{R"(\bAdd-Content\b.*{path})", "append"},
            OperationTemplate{R"(\bOut-File\b.*-Append.*{path})", "append"},
        };

        constexpr std::array WINDOWS_EDIT{
            OperationTemplate{R"(\(\s*Get-Content\s+.*{path}.*\)\s*-replace\b)", "edit"},
            OperationTemplate{R"(\bnotepad(?:\.exe)?\s+.*{path})", "edit"},
        };

        constexpr std::array WINDOWS_MOVE_COPY{
            OperationTemplate{R"(\b(?:move|mv|Move-Item)\s+.*\s+{path})", "move"},
            OperationTemplate{R"(\b(?:copy|cp|xcopy|robocopy|Copy-Item)\s+.*\s+{path})", "copy"},
        };

        constexpr std::array WINDOWS_DELETE{
            OperationTemplate{R"(\b(?:del|erase)\s+.*{path})", "delete"},
            OperationTemplate{R"(\b(?:rd|rmdir)\s+.*{path})", "delete"},
            OperationTemplate{R"(\bRemove-Item\b.*{path})", "delete"},
        };

        constexpr std::array WINDOWS_PERMISSION{
            OperationTemplate{R"(\bicacls\s+.*{path})", "icacls"},
            OperationTemplate{R"(\battrib\s+.*{path})", "attrib"},
            OperationTemplate{R"(\btakeown\s+.*{path})", "takeown"},
            OperationTemplate{R"(\bSet-Acl\b.*{path})", "set-acl"},
        };

        constexpr std::array WINDOWS_TRUNCATE{
            OperationTemplate{R"(\bClear-Content\b.*{path})", "truncate"},
            OperationTemplate{R"(\btype\s+nul\s*>\s*{path})", "truncate"},
        };

        // Indexed by OperationClass
        constexpr OperationTable POSIX_TABLE{
            Platform::posix,
            {
                OperationTemplates{POSIX_WRITE},
                OperationTemplates{POSIX_APPEND},
                OperationTemplates{POSIX_EDIT},
                OperationTemplates{POSIX_MOVE_COPY},
                OperationTemplates{POSIX_DELETE},
                OperationTemplates{POSIX_PERMISSION},
                OperationTemplates{POSIX_TRUNCATE},
            }
        };

        constexpr OperationTable WINDOWS_TABLE{
            Platform::windows,
            {
                OperationTemplates{WINDOWS_WRITE},
                OperationTemplates{WINDOWS_APPEND},
                OperationTemplates{WINDOWS_EDIT},
                OperationTemplates{WINDOWS_MOVE_COPY},
                OperationTemplates{WINDOWS_DELETE},
                OperationTemplates{WINDOWS_PERMISSION},
                OperationTemplates{WINDOWS_TRUNCATE},
            }
        };

        //
        // Replace every {path} placeholder in a template.
        //
        auto instantiate(std::string_view tmpl, std::string_view fragment) -> std::string {
            std::string result;
            std::size_t start = 0;

            while (true) {
                auto pos = tmpl.find(PATH_PLACEHOLDER, start);
                if (pos == std::string_view::npos) {
                    result += tmpl.substr(start);
                    break;
                }
                result += tmpl.substr(start, pos - start);
                result += fragment;
                start = pos + PATH_PLACEHOLDER.size();
            }

            return result;
        }

        //
        // Compile one rule into out, recording a failure instead of throwing.
        //
        void compile_into(CompiledOperations& out, PathPattern const& pattern,
                          std::string operation, std::string source) {
            try {
                std::regex regex{source, REGEX_FLAGS};
                out.rules.push_back(CompiledOperationRule{
                    .operation = std::move(operation),
                    .source = std::move(source),
                    .regex = std::move(regex)
                });
            } catch (std::regex_error const& e) {
                out.errors.push_back(std::format("Skipping {} rule for path {}: {}",
                                                 operation, pattern.text, e.what()));
            }
        }

    }  // anonymous namespace

    auto operation_table(Platform platform) -> OperationTable const& {
        switch (platform) {
            case Platform::posix:
                return POSIX_TABLE;
            case Platform::windows:
                return WINDOWS_TABLE;
        }
        return POSIX_TABLE;
    }

    auto path_fragments(PathPattern const& pattern, Platform platform)
        -> std::vector<std::string> {
        auto const expanded = expand_path(pattern.text, platform);

        auto translate = [&](std::string_view text) {
            return pattern.kind == PatternKind::glob ? glob_to_regex(text, platform)
                                                     : escape_regex(text);
        };

        std::vector<std::string> fragments;
        fragments.push_back(translate(pattern.text));
        if (expanded != pattern.text) {
            fragments.push_back(translate(expanded));
        }
        return fragments;
    }

    auto compile_operation_rules(PathPattern const& pattern,
                                 std::span<OperationClass const> classes,
                                 OperationTable const& table) -> CompiledOperations {
        CompiledOperations result;
        if (pattern.text.empty()) {
            return result;
        }

        auto const fragments = path_fragments(pattern, table.platform);

        for (auto const op : classes) {
            for (auto const& tmpl : table[op]) {
                for (auto const& fragment : fragments) {
                    compile_into(result, pattern, std::string{tmpl.operation},
                                 instantiate(tmpl.regex, fragment));
                }
            }
        }

        return result;
    }

    auto compile_operation_rules(PathPattern const& pattern,
                                 std::span<OperationClass const> classes,
                                 Platform platform) -> CompiledOperations {
        return compile_operation_rules(pattern, classes, operation_table(platform));
    }

    auto compile_reference_rules(PathPattern const& pattern, Platform platform)
        -> CompiledOperations {
        CompiledOperations result;
        if (pattern.text.empty()) {
            return result;
        }

        for (auto& fragment : path_fragments(pattern, platform)) {
            compile_into(result, pattern, "reference", std::move(fragment));
        }

        return result;
    }

    auto match_any(std::string_view command, std::span<CompiledOperationRule const> rules)
        -> std::optional<std::string> {
        for (auto const& rule : rules) {
            if (std::regex_search(command.begin(), command.end(), rule.regex)) {
                return rule.operation;
            }
        }
        return std::nullopt;
    }

    auto to_string(OperationClass op) -> std::string {
        switch (op) {
            case OperationClass::write:
                return "write";
            case OperationClass::append:
                return "append";
            case OperationClass::edit:
                return "edit";
            case OperationClass::move_copy:
                return "move_copy";
            case OperationClass::deletion:
                return "delete";
            case OperationClass::permission:
                return "permission";
            case OperationClass::truncate:
                return "truncate";
        }
        return "unknown";
    }

}  // namespace hook_warden
