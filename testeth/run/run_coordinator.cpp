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

#include <testeth/run/run_coordinator.hpp>

#include <testeth/bench/benchmark_aggregator.hpp>
#include <testeth/bench/run_record.hpp>
#include <testeth/compare/verdict.hpp>
#include <testeth/core/assert.h>
#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/core/stopwatch.hpp>
#include <testeth/core/worker_pool.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/registry/tool_registry.hpp>
#include <testeth/run/run_config.hpp>
#include <testeth/vector/loader_error.hpp>
#include <testeth/vector/test_case.hpp>
#include <testeth/vector/test_vector_loader.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <exception>
#include <optional>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TESTETH_NAMESPACE_BEGIN

std::string_view to_string(RunState const state)
{
    switch (state) {
    case RunState::Idle:
        return "idle";
    case RunState::Loading:
        return "loading";
    case RunState::Executing:
        return "executing";
    case RunState::Summarizing:
        return "summarizing";
    case RunState::Done:
        return "done";
    case RunState::Failed:
        return "failed";
    }
    return "unknown";
}

RunCoordinator::RunCoordinator(ToolRegistry const &registry, RunConfig config)
    : registry_{registry}
    , config_{std::move(config)}
    , runner_{config_.max_output_bytes}
    , comparator_{config_.log_order}
{
    TESTETH_ASSERT(config_.pool_size > 0);
    TESTETH_ASSERT(config_.repetitions > 0);
}

void RunCoordinator::set_state(RunState const state)
{
    LOG_DEBUG(
        "run state {} -> {}",
        std::string{to_string(state_.load(std::memory_order_relaxed))},
        std::string{to_string(state)});
    state_.store(state, std::memory_order_release);
}

Result<RunSummary> RunCoordinator::run(
    std::filesystem::path const &test_path, std::stop_token stop)
{
    auto const current = state();
    TESTETH_ASSERT(
        current == RunState::Idle || current == RunState::Done ||
            current == RunState::Failed,
        "run already in progress");

    aggregator_.clear();
    set_state(RunState::Loading);
    auto report = [&] {
        Stopwatch<std::chrono::milliseconds> const sw{"loading"};
        return load_test_vectors_report(test_path);
    }();
    if (report.has_error()) {
        set_state(RunState::Failed);
        return std::move(report).as_failure();
    }

    RunSummary summary;
    summary.malformed = std::move(report.value().malformed);
    return execute(report.value().cases, stop, std::move(summary));
}

Result<RunSummary> RunCoordinator::run(
    std::vector<TestCase> const &tests, std::stop_token stop)
{
    auto const current = state();
    TESTETH_ASSERT(
        current == RunState::Idle || current == RunState::Done ||
            current == RunState::Failed,
        "run already in progress");

    aggregator_.clear();
    set_state(RunState::Loading);
    if (tests.empty()) {
        LOG_ERROR("no test cases to run");
        set_state(RunState::Failed);
        return LoaderError::NoTestCasesFound;
    }
    return execute(tests, stop, RunSummary{});
}

Result<RunSummary> RunCoordinator::execute(
    std::vector<TestCase> const &tests, std::stop_token const &stop,
    RunSummary summary)
{
    // the registry must not change during the run; units refer to this copy
    std::vector<ToolEntry> const tools = registry_.list();
    if (tools.empty()) {
        LOG_WARNING("no tools registered");
    }

    summary.tests = tests.size();
    summary.tools = tools.size();

    set_state(RunState::Executing);
    LOG_INFO(
        "running {} tests against {} tools, {} repetitions, {} workers",
        tests.size(),
        tools.size(),
        config_.repetitions,
        config_.pool_size);

    {
        Stopwatch<std::chrono::milliseconds> const sw{"execution"};
        WorkerPool pool{config_.pool_size};
        for (auto const &test : tests) {
            for (auto const &tool : tools) {
                for (unsigned rep = 0; rep < config_.repetitions; ++rep) {
                    if (stop.stop_requested()) {
                        break;
                    }
                    pool.submit([this, &tool, &test, rep, stop] {
                        execute_unit(tool, test, rep, stop);
                    });
                    ++summary.units;
                }
            }
        }
        pool.drain();
        summary.elapsed = sw.elapsed();
    }

    set_state(RunState::Summarizing);
    summary.cancelled = stop.stop_requested();
    summary.records = aggregator_.get_records().size();
    summary.summaries = aggregator_.get_summaries();
    if (summary.cancelled) {
        LOG_WARNING(
            "run cancelled, {} of {} units recorded",
            summary.records,
            summary.units);
    }
    else {
        LOG_INFO("run finished, {} units recorded", summary.records);
    }
    set_state(RunState::Done);
    return summary;
}

void RunCoordinator::execute_unit(
    ToolEntry const &tool, TestCase const &test, unsigned const repetition,
    std::stop_token const &stop)
{
    // dropped without a record
    if (stop.stop_requested()) {
        return;
    }

    auto const begin = std::chrono::steady_clock::now();
    RunRecord record{
        .tool_name = tool.name,
        .test_id = test.id,
        .verdict = Pass{},
        .duration = {},
        .reported_duration = std::nullopt,
        .repetition = repetition};
    try {
        auto const args = normalizer_.per_test_args(tool, test);
        LOG_DEBUG(
            "{} {}: {}",
            tool.name,
            test.id,
            fmt::format(
                "{}", fmt::join(ProcessRunner::command_line(tool, args), " ")));
        auto res = runner_.run(tool, args, test.input, config_.timeout, stop);
        if (res.has_error()) {
            std::string const message{res.error().message().c_str()};
            LOG_ERROR("{} {}: could not start tool: {}", tool.name, test.id, message);
            record.verdict = ToolError{.exit_code = -1, .stderr_text = message};
            // time spent up to the failure, so it does not read as a 0 ns run
            record.duration = std::chrono::steady_clock::now() - begin;
        }
        else {
            auto const &raw = res.value();
            if (raw.cancelled) {
                return;
            }
            if (raw.stdout_truncated || raw.stderr_truncated) {
                LOG_WARNING(
                    "{} {}: output truncated to {} bytes",
                    tool.name,
                    test.id,
                    config_.max_output_bytes);
            }
            ExecutionResult normalized;
            record.verdict =
                comparator_.evaluate(normalizer_, tool, raw, test, &normalized);
            record.duration = raw.duration;
            record.reported_duration = normalized.reported_duration;
        }
    }
    catch (std::exception const &e) {
        LOG_ERROR("{} {}: {}", tool.name, test.id, e.what());
        record.verdict = LoadError{e.what()};
        record.duration = std::chrono::steady_clock::now() - begin;
    }
    LOG_DEBUG("{} {}: {}", tool.name, test.id, describe(record.verdict));
    aggregator_.record(std::move(record));
}

TESTETH_NAMESPACE_END
