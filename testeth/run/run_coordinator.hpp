// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <testeth/bench/benchmark_aggregator.hpp>
#include <testeth/compare/result_comparator.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/exec/process_runner.hpp>
#include <testeth/normalize/output_normalizer.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/registry/tool_registry.hpp>
#include <testeth/run/run_config.hpp>
#include <testeth/vector/test_case.hpp>
#include <testeth/vector/test_vector_loader.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

TESTETH_NAMESPACE_BEGIN

enum class RunState : uint8_t
{
    Idle,
    Loading,
    Executing,
    Summarizing,
    Done,
    Failed,
};

std::string_view to_string(RunState);

struct RunSummary
{
    size_t tests{0};
    size_t tools{0};
    // (test, tool, repetition) units enqueued
    size_t units{0};
    // units that produced a record; fewer than `units` after cancellation
    size_t records{0};
    bool cancelled{false};
    std::chrono::nanoseconds elapsed{0};
    std::map<std::string, ToolSummary> summaries{};
    // source files skipped by the loader
    std::vector<MalformedTestVector> malformed{};
};

/**
 * Runs every registered tool against every test case on a bounded worker
 * pool. Failures of a single unit become verdicts; only loading can fail the
 * run as a whole. One run at a time per coordinator.
 */
class RunCoordinator
{
    ToolRegistry const &registry_;
    RunConfig const config_;
    ProcessRunner const runner_;
    OutputNormalizer const normalizer_;
    ResultComparator const comparator_;
    BenchmarkAggregator aggregator_{};
    std::atomic<RunState> state_{RunState::Idle};

public:
    explicit RunCoordinator(ToolRegistry const &, RunConfig = {});

    RunCoordinator(RunCoordinator const &) = delete;
    RunCoordinator &operator=(RunCoordinator const &) = delete;

    Result<RunSummary>
    run(std::filesystem::path const &, std::stop_token = {});

    Result<RunSummary> run(std::vector<TestCase> const &, std::stop_token = {});

    RunState state() const noexcept
    {
        return state_.load(std::memory_order_acquire);
    }

    RunConfig const &config() const noexcept
    {
        return config_;
    }

    /// Records of the last run, also after cancellation
    BenchmarkAggregator const &aggregator() const noexcept
    {
        return aggregator_;
    }

private:
    void set_state(RunState);

    Result<RunSummary> execute(
        std::vector<TestCase> const &, std::stop_token const &,
        RunSummary summary);

    void execute_unit(
        ToolEntry const &, TestCase const &, unsigned repetition,
        std::stop_token const &);
};

TESTETH_NAMESPACE_END
