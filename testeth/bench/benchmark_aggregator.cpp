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

#include <testeth/bench/benchmark_aggregator.hpp>

#include <testeth/bench/run_record.hpp>
#include <testeth/compare/verdict.hpp>
#include <testeth/core/config.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <numeric>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

ToolSummary summarize_durations(std::vector<double> durations, size_t passes)
{
    ToolSummary summary;
    summary.count = durations.size();
    summary.passes = passes;
    if (durations.empty()) {
        return summary;
    }

    auto const to_ns = [](double const v) {
        return std::chrono::nanoseconds{static_cast<int64_t>(std::llround(v))};
    };

    double const n = static_cast<double>(durations.size());
    summary.pass_rate = static_cast<double>(passes) / n;

    std::sort(durations.begin(), durations.end());
    double const sum =
        std::accumulate(durations.begin(), durations.end(), 0.0);
    double const mean = sum / n;
    summary.mean = to_ns(mean);
    summary.min = to_ns(durations.front());
    summary.max = to_ns(durations.back());

    size_t const mid = durations.size() / 2;
    summary.median = durations.size() % 2
                         ? to_ns(durations[mid])
                         : to_ns((durations[mid - 1] + durations[mid]) / 2);

    // population standard deviation
    double sq = 0;
    for (double const d : durations) {
        sq += (d - mean) * (d - mean);
    }
    summary.stddev = to_ns(std::sqrt(sq / n));
    return summary;
}

TESTETH_ANONYMOUS_NAMESPACE_END

TESTETH_NAMESPACE_BEGIN

void BenchmarkAggregator::record(RunRecord record)
{
    std::lock_guard const guard{lock_};
    records_.push_back(std::move(record));
}

std::vector<RunRecord> BenchmarkAggregator::get_records() const
{
    std::lock_guard const guard{lock_};
    return records_;
}

ToolSummary BenchmarkAggregator::summarize(std::string_view const tool_name) const
{
    std::vector<double> durations;
    size_t passes = 0;
    {
        std::lock_guard const guard{lock_};
        for (auto const &r : records_) {
            if (r.tool_name != tool_name) {
                continue;
            }
            durations.push_back(static_cast<double>(r.duration.count()));
            passes += is_pass(r.verdict);
        }
    }
    return summarize_durations(std::move(durations), passes);
}

std::map<std::string, ToolSummary> BenchmarkAggregator::get_summaries() const
{
    std::set<std::string> tools;
    {
        std::lock_guard const guard{lock_};
        for (auto const &r : records_) {
            tools.insert(r.tool_name);
        }
    }
    std::map<std::string, ToolSummary> summaries;
    for (auto const &tool : tools) {
        summaries.emplace(tool, summarize(tool));
    }
    return summaries;
}

void BenchmarkAggregator::clear()
{
    std::lock_guard const guard{lock_};
    records_.clear();
}

TESTETH_NAMESPACE_END
