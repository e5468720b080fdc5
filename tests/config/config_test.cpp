//
// hook-warden - Rule Configuration Tests
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>
#include <policy/policy_engine.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace hook_warden {

    namespace {

        void write_file(std::filesystem::path const& path, std::string_view contents) {
            std::ofstream file(path);
            file << contents;
        }

    }  // anonymous namespace

    TEST(ConfigTest, ParseEmptyFile) {
        auto result = parse_rule_file("");

        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->rules.empty());
        EXPECT_FALSE(result->settings.fail_closed);
        EXPECT_TRUE(result->settings.log_decisions);
    }

    TEST(ConfigTest, ParseFullFile) {
        auto result = parse_rule_file(R"(
[settings]
fail_closed = true
log_decisions = false

[paths]
zero_access = ["~/.ssh", "*.pem"]
read_only = ["/etc"]
no_delete = ["/var/log/app.log", ""]

[[generic_rules]]
pattern = '\bsudo\b'
reason = "elevated privileges"
ask = true

[[generic_rules]]
pattern = '\bmkfs\b'
)");

        ASSERT_TRUE(result.has_value()) << result.error();
        auto const& file = result.value();

        EXPECT_TRUE(file.settings.fail_closed);
        EXPECT_FALSE(file.settings.log_decisions);

        ASSERT_EQ(file.rules.zero_access_paths.size(), 2u);
        EXPECT_EQ(file.rules.zero_access_paths[0], (PathPattern{"~/.ssh", PatternKind::literal}));
        EXPECT_EQ(file.rules.zero_access_paths[1], (PathPattern{"*.pem", PatternKind::glob}));

        ASSERT_EQ(file.rules.read_only_paths.size(), 1u);
        EXPECT_EQ(file.rules.read_only_paths[0].text, "/etc");

        // Empty entries are dropped
        ASSERT_EQ(file.rules.no_delete_paths.size(), 1u);
        EXPECT_EQ(file.rules.no_delete_paths[0].text, "/var/log/app.log");

        ASSERT_EQ(file.rules.generic_rules.size(), 2u);
        EXPECT_EQ(file.rules.generic_rules[0].pattern, R"(\bsudo\b)");
        EXPECT_EQ(file.rules.generic_rules[0].reason, "elevated privileges");
        EXPECT_TRUE(file.rules.generic_rules[0].ask);

        EXPECT_EQ(file.rules.generic_rules[1].reason, R"(command matches \bmkfs\b)");
        EXPECT_FALSE(file.rules.generic_rules[1].ask);
    }

    TEST(ConfigTest, MissingPatternIsAnError) {
        auto result = parse_rule_file(R"(
[[generic_rules]]
reason = "no pattern"
)");

        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("Config error"), std::string::npos);
        EXPECT_NE(result.error().find("generic_rules[0]: missing required key: pattern"),
                  std::string::npos);
    }

    TEST(ConfigTest, NonStringPathIsAnError) {
        auto result = parse_rule_file(R"(
[paths]
read_only = ["/etc", 42]
)");

        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("paths.read_only[1] must be a string"), std::string::npos);
    }

    TEST(ConfigTest, PathListMustBeArray) {
        auto result = parse_rule_file(R"(
[paths]
no_delete = "/var/log"
)");

        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("paths.no_delete must be an array of strings"),
                  std::string::npos);
    }

    TEST(ConfigTest, InvalidTomlSyntax) {
        auto result = parse_rule_file("this is not valid toml [[[");

        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("TOML parse error"), std::string::npos);
    }

    TEST(ConfigTest, LoadRuleFileFromDisk) {
        auto temp_path = std::filesystem::temp_directory_path() / "hw_test_rules.toml";
        write_file(temp_path, R"(
[paths]
read_only = ["/etc"]
)");

        auto result = load_rule_file(temp_path);
        ASSERT_TRUE(result.has_value()) << result.error();
        ASSERT_EQ(result->rules.read_only_paths.size(), 1u);

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, LoadErrorNamesFile) {
        auto temp_path = std::filesystem::temp_directory_path() / "hw_test_invalid.toml";
        write_file(temp_path, "[paths\nread_only = 1");

        auto result = load_rule_file(temp_path);
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find(temp_path.string()), std::string::npos);
        EXPECT_NE(result.error().find("TOML parse error"), std::string::npos);

        std::filesystem::remove(temp_path);
    }

    TEST(ConfigTest, MissingFileOrEmpty) {
        auto result = load_rule_file_or_empty("/nonexistent/path/rules.toml");

        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->rules.empty());

        EXPECT_FALSE(load_rule_file("/nonexistent/path/rules.toml").has_value());
    }

    TEST(ConfigTest, OverlayFileName) {
        EXPECT_EQ(overlay_file_name(Platform::posix), "rules.posix.toml");
        EXPECT_EQ(overlay_file_name(Platform::windows), "rules.windows.toml");
    }

    TEST(ConfigTest, ShippedRulesCompileCleanly) {
        std::filesystem::path const dir{HOOK_WARDEN_CONFIG_DIR};

        for (auto const platform : {Platform::posix, Platform::windows}) {
            RuleSources sources{dir / BASE_RULE_FILE, dir / overlay_file_name(platform)};
            auto result = load_merged_rules(sources);
            ASSERT_TRUE(result.has_value()) << result.error();
            EXPECT_FALSE(result->rules.generic_rules.empty());
            EXPECT_FALSE(result->rules.zero_access_paths.empty());

            PolicyEngine engine{result->rules, platform};
            EXPECT_TRUE(engine.warnings().empty()) << engine.warnings().front();
        }
    }

    TEST(ConfigTest, ShippedPosixRulesDecide) {
        std::filesystem::path const dir{HOOK_WARDEN_CONFIG_DIR};
        auto result = load_merged_rules(RuleSources{dir / BASE_RULE_FILE,
                                                    dir / overlay_file_name(Platform::posix)});
        ASSERT_TRUE(result.has_value()) << result.error();

        PolicyEngine engine{result->rules, Platform::posix};
        EXPECT_TRUE(is_allow(engine.evaluate_command("ls -la src")));
        EXPECT_TRUE(is_block(engine.evaluate_command("rm -rf /")));
        EXPECT_TRUE(is_ask(engine.evaluate_command("git reset --hard HEAD~1")));
        EXPECT_TRUE(is_ask(engine.evaluate_command("sudo apt update")));
        EXPECT_TRUE(is_block(engine.evaluate_command("cat /etc/shadow")));
        EXPECT_TRUE(is_block(engine.evaluate_path_edit("server.pem")));
    }

    class RuleDiscoveryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            m_root = std::filesystem::temp_directory_path() / "hw_test_discovery";
            std::filesystem::remove_all(m_root);
            for (auto const* name : {"project", "user", "system"}) {
                std::filesystem::create_directories(m_root / name);
            }
        }

        void TearDown() override {
            std::filesystem::remove_all(m_root);
        }

        [[nodiscard]] auto dirs() const -> std::vector<std::filesystem::path> {
            return {m_root / "project", m_root / "user", m_root / "system"};
        }

        std::filesystem::path m_root;
    };

    TEST_F(RuleDiscoveryTest, NothingFound) {
        auto sources = discover_rule_files(dirs(), Platform::posix);

        EXPECT_FALSE(sources.found());

        auto merged = load_merged_rules(sources);
        ASSERT_TRUE(merged.has_value());
        EXPECT_TRUE(merged->rules.empty());
    }

    TEST_F(RuleDiscoveryTest, FirstDirectoryWithBaseWins) {
        write_file(m_root / "user" / "rules.toml", "[paths]\nread_only = [\"/user\"]\n");
        write_file(m_root / "user" / "rules.posix.toml", "[paths]\nread_only = [\"/posix\"]\n");
        write_file(m_root / "system" / "rules.toml", "[paths]\nread_only = [\"/system\"]\n");

        // An overlay without a base does not select its directory
        write_file(m_root / "project" / "rules.posix.toml", "[paths]\nread_only = [\"/p\"]\n");

        auto sources = discover_rule_files(dirs(), Platform::posix);
        ASSERT_TRUE(sources.base.has_value());
        EXPECT_EQ(*sources.base, m_root / "user" / "rules.toml");
        ASSERT_TRUE(sources.overlay.has_value());
        EXPECT_EQ(*sources.overlay, m_root / "user" / "rules.posix.toml");

        auto merged = load_merged_rules(sources);
        ASSERT_TRUE(merged.has_value()) << merged.error();
        ASSERT_EQ(merged->rules.read_only_paths.size(), 2u);
        EXPECT_EQ(merged->rules.read_only_paths[0].text, "/user");
        EXPECT_EQ(merged->rules.read_only_paths[1].text, "/posix");
    }

    TEST_F(RuleDiscoveryTest, OverlayForOtherPlatformIgnored) {
        write_file(m_root / "system" / "rules.toml", "");
        write_file(m_root / "system" / "rules.windows.toml", "");

        auto sources = discover_rule_files(dirs(), Platform::posix);
        EXPECT_TRUE(sources.base.has_value());
        EXPECT_FALSE(sources.overlay.has_value());
    }

    TEST_F(RuleDiscoveryTest, SettingsComeFromBase) {
        write_file(m_root / "system" / "rules.toml", "[settings]\nfail_closed = false\n");
        write_file(m_root / "system" / "rules.posix.toml", "[settings]\nfail_closed = true\n");

        auto merged = load_merged_rules(discover_rule_files(dirs(), Platform::posix));
        ASSERT_TRUE(merged.has_value()) << merged.error();
        EXPECT_FALSE(merged->settings.fail_closed);
    }

    TEST_F(RuleDiscoveryTest, BrokenOverlayFailsLoad) {
        write_file(m_root / "system" / "rules.toml", "");
        write_file(m_root / "system" / "rules.posix.toml", "[[generic_rules]]\nask = true\n");

        auto merged = load_merged_rules(discover_rule_files(dirs(), Platform::posix));
        ASSERT_FALSE(merged.has_value());
        EXPECT_NE(merged.error().find("rules.posix.toml"), std::string::npos);
    }

    TEST_F(RuleDiscoveryTest, DefaultSearchDirsFollowEnvironment) {
        setenv("HOOK_WARDEN_PROJECT_DIR", (m_root / "project").c_str(), 1);
        setenv("XDG_CONFIG_HOME", (m_root / "user").c_str(), 1);

        auto search = default_search_dirs();

        unsetenv("HOOK_WARDEN_PROJECT_DIR");
        unsetenv("XDG_CONFIG_HOME");

        ASSERT_EQ(search.size(), 3u);
        EXPECT_EQ(search[0], m_root / "project" / ".hook-warden");
        EXPECT_EQ(search[1], m_root / "user" / "hook-warden");
        EXPECT_EQ(search[2], std::filesystem::path{"/etc/hook-warden"});
    }

}  // namespace hook_warden
