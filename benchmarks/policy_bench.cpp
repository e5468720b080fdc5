//
// hook-warden - Policy Engine Benchmarks
//
// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2026 Tony Walker
//

#include <config/config.h>
#include <policy/policy_engine.h>

#include <benchmark/benchmark.h>

#include <format>
#include <string>

namespace hook_warden {

    //
    // Build a configuration with count entries in every path tier.
    //
    static auto make_config(std::size_t count) -> RuleConfig {
        RuleConfig config;
        config.generic_rules.push_back({R"(\bmkfs\b)", "filesystem format", false});
        config.generic_rules.push_back({R"(\bsudo\b)", "elevated privileges", true});

        for (std::size_t i = 0; i < count; ++i) {
            config.zero_access_paths.push_back(classify_pattern(std::format("/secret/{}/*.key", i)));
            config.read_only_paths.push_back(classify_pattern(std::format("/etc/app{}", i)));
            config.no_delete_paths.push_back(classify_pattern(std::format("/var/log/app{}.log", i)));
        }
        return config;
    }

    //
    // Benchmark compiling the rule set (once per hook invocation).
    //

    static void BM_CompileEngine(benchmark::State& state) {
        auto config = make_config(static_cast<std::size_t>(state.range(0)));
        for (auto _ : state) {
            PolicyEngine engine{config, Platform::posix};
            benchmark::DoNotOptimize(engine);
        }
    }
    BENCHMARK(BM_CompileEngine)->Arg(4)->Arg(16)->Arg(64);

    //
    // Benchmark evaluating a command that passes every tier.
    //

    static void BM_EvaluateAllowedCommand(benchmark::State& state) {
        auto config = make_config(static_cast<std::size_t>(state.range(0)));
        PolicyEngine engine{config, Platform::posix};
        std::string const command = "grep -rn TODO src/ | sort | uniq -c > /tmp/todo.txt";

        for (auto _ : state) {
            auto decision = engine.evaluate_command(command);
            benchmark::DoNotOptimize(decision);
        }
    }
    BENCHMARK(BM_EvaluateAllowedCommand)->Arg(4)->Arg(16)->Arg(64);

    //
    // Benchmark evaluating a direct file edit.
    //

    static void BM_EvaluatePathEdit(benchmark::State& state) {
        auto config = make_config(static_cast<std::size_t>(state.range(0)));
        PolicyEngine engine{config, Platform::posix};

        for (auto _ : state) {
            auto decision = engine.evaluate_path_edit("/home/user/project/src/main.cpp");
            benchmark::DoNotOptimize(decision);
        }
    }
    BENCHMARK(BM_EvaluatePathEdit)->Arg(4)->Arg(16)->Arg(64);

}  // namespace hook_warden

BENCHMARK_MAIN();
