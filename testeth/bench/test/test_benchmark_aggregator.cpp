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

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace testeth;
using namespace std::chrono_literals;

namespace
{
    RunRecord
    make_record(std::string tool, std::string test, Verdict verdict,
                std::chrono::nanoseconds duration)
    {
        return RunRecord{
            .tool_name = std::move(tool),
            .test_id = std::move(test),
            .verdict = std::move(verdict),
            .duration = duration,
            .reported_duration = std::nullopt,
            .repetition = 0};
    }
}

TEST(BenchmarkAggregator, summary_statistics)
{
    BenchmarkAggregator aggregator;
    aggregator.record(make_record("A", "t1", Pass{}, 10ms));
    aggregator.record(make_record("A", "t2", Timeout{}, 40ms));
    aggregator.record(make_record("A", "t3", Pass{}, 20ms));
    aggregator.record(make_record("A", "t4", Pass{}, 30ms));
    aggregator.record(make_record("B", "t1", LoadError{"x"}, 1ms));

    auto const a = aggregator.summarize("A");
    EXPECT_EQ(a.count, 4);
    EXPECT_EQ(a.passes, 3);
    EXPECT_DOUBLE_EQ(a.pass_rate, 0.75);
    EXPECT_EQ(a.min, 10ms);
    EXPECT_EQ(a.max, 40ms);
    EXPECT_EQ(a.mean, 25ms);
    EXPECT_EQ(a.median, 25ms);
    // population stddev of 10, 20, 30, 40 ms
    EXPECT_NEAR(
        std::chrono::duration<double, std::milli>(a.stddev).count(),
        11.1803,
        0.001);
    EXPECT_LE(a.min, a.mean);
    EXPECT_LE(a.mean, a.max);

    auto const b = aggregator.summarize("B");
    EXPECT_EQ(b.count, 1);
    EXPECT_EQ(b.passes, 0);
    EXPECT_DOUBLE_EQ(b.pass_rate, 0.0);
    EXPECT_EQ(b.median, 1ms);
    EXPECT_EQ(b.stddev, 0ns);
}

TEST(BenchmarkAggregator, unknown_tool_is_zero)
{
    BenchmarkAggregator aggregator;
    aggregator.record(make_record("A", "t1", Pass{}, 10ms));
    auto const summary = aggregator.summarize("nope");
    EXPECT_EQ(summary.count, 0);
    EXPECT_EQ(summary.passes, 0);
    EXPECT_EQ(summary.mean, 0ns);
}

TEST(BenchmarkAggregator, summaries_and_records)
{
    BenchmarkAggregator aggregator;
    aggregator.record(make_record("B", "t1", Pass{}, 1ms));
    aggregator.record(make_record("A", "t1", Pass{}, 2ms));
    aggregator.record(make_record("B", "t2", Timeout{}, 3ms));

    auto const summaries = aggregator.get_summaries();
    ASSERT_EQ(summaries.size(), 2);
    EXPECT_EQ(summaries.at("A").count, 1);
    EXPECT_EQ(summaries.at("B").count, 2);
    EXPECT_DOUBLE_EQ(summaries.at("B").pass_rate, 0.5);

    auto const records = aggregator.get_records();
    ASSERT_EQ(records.size(), 3);
    EXPECT_EQ(records[0].tool_name, "B");
    EXPECT_EQ(records[1].tool_name, "A");
    EXPECT_EQ(records[2].test_id, "t2");

    aggregator.clear();
    EXPECT_TRUE(aggregator.get_records().empty());
    EXPECT_TRUE(aggregator.get_summaries().empty());
}

TEST(BenchmarkAggregator, concurrent_appends)
{
    BenchmarkAggregator aggregator;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&aggregator, t] {
            for (int i = 0; i < 500; ++i) {
                aggregator.record(make_record(
                    "tool" + std::to_string(t % 2),
                    "t" + std::to_string(i),
                    Pass{},
                    1ms));
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    EXPECT_EQ(aggregator.get_records().size(), 4000);
    EXPECT_EQ(aggregator.summarize("tool0").count, 2000);
    EXPECT_EQ(aggregator.summarize("tool1").passes, 2000);
}
