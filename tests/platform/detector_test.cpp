//
// hook-warden - Platform Detection Tests
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <platform/detector.h>

#include <gtest/gtest.h>

#include <cstdlib>

namespace hook_warden {

    class PlatformDetectorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            unsetenv(PLATFORM_ENV);
        }

        void TearDown() override {
            unsetenv(PLATFORM_ENV);
        }
    };

    TEST_F(PlatformDetectorTest, StringToPlatform) {
        EXPECT_EQ(string_to_platform("posix").value(), Platform::posix);
        EXPECT_EQ(string_to_platform("Linux").value(), Platform::posix);
        EXPECT_EQ(string_to_platform("darwin").value(), Platform::posix);
        EXPECT_EQ(string_to_platform("windows").value(), Platform::windows);
        EXPECT_EQ(string_to_platform("WIN32").value(), Platform::windows);
    }

    TEST_F(PlatformDetectorTest, StringToPlatformRejectsUnknown) {
        auto result = string_to_platform("plan9");
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("plan9"), std::string::npos);
    }

    TEST_F(PlatformDetectorTest, ToString) {
        EXPECT_EQ(to_string(Platform::posix), "posix");
        EXPECT_EQ(to_string(Platform::windows), "windows");
    }

    TEST_F(PlatformDetectorTest, HostPlatformIsPosix) {
        EXPECT_EQ(host_platform(), Platform::posix);
    }

    TEST_F(PlatformDetectorTest, EnvironmentOverrideWins) {
        setenv(PLATFORM_ENV, "windows", 1);
        auto result = detect_platform();
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(*result, Platform::windows);

        setenv(PLATFORM_ENV, "posix", 1);
        result = detect_platform();
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(*result, Platform::posix);
    }

    TEST_F(PlatformDetectorTest, InvalidOverrideIsAnError) {
        setenv(PLATFORM_ENV, "beos", 1);
        auto result = detect_platform();
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find(PLATFORM_ENV), std::string::npos);
    }

    TEST_F(PlatformDetectorTest, WindowsShellEnvironment) {
        auto const* saved = std::getenv("OSTYPE");
        std::string saved_value = saved ? saved : "";

        setenv("OSTYPE", "msys", 1);
        EXPECT_TRUE(is_windows_environment());

        setenv("OSTYPE", "linux-gnu", 1);
        if (auto const* os = std::getenv("OS"); !os || std::string{os} != "Windows_NT") {
            EXPECT_FALSE(is_windows_environment());
        }

        if (saved) {
            setenv("OSTYPE", saved_value.c_str(), 1);
        } else {
            unsetenv("OSTYPE");
        }
    }

}  // namespace hook_warden
