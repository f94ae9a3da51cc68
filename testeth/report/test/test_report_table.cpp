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
#include <testeth/report/report_table.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace testeth;
using namespace std::chrono_literals;

namespace
{
    RunRecord make_record(
        std::string tool, std::string test, Verdict verdict,
        std::chrono::nanoseconds duration, unsigned repetition = 0)
    {
        return RunRecord{
            .tool_name = std::move(tool),
            .test_id = std::move(test),
            .verdict = std::move(verdict),
            .duration = duration,
            .reported_duration = std::nullopt,
            .repetition = repetition};
    }

    std::vector<std::string> lines(std::string const &text)
    {
        std::vector<std::string> out;
        std::istringstream in{text};
        for (std::string line; std::getline(in, line);) {
            out.push_back(line);
        }
        return out;
    }
}

TEST(ReportTable, results_one_row_per_test)
{
    std::vector<RunRecord> const records = {
        make_record("A", "long_test_name", Pass{}, 1500us),
        make_record("B", "long_test_name", Timeout{}, 10ms),
        make_record("A", "t2", Pass{}, 2ms, 0),
        make_record("A", "t2", LoadError{"x"}, 4ms, 1),
    };
    auto const table = lines(render_results_table(records, {"A", "B"}));
    ASSERT_EQ(table.size(), 4);
    EXPECT_TRUE(table[0].starts_with("test"));
    EXPECT_NE(table[0].find("| "), std::string::npos);
    EXPECT_EQ(table[1].find_first_not_of('-'), std::string::npos);

    EXPECT_TRUE(table[2].starts_with("long_test_name"));
    EXPECT_NE(table[2].find("1.500 ms pass"), std::string::npos);
    EXPECT_NE(table[2].find("10.000 ms timeout"), std::string::npos);

    // mean of the repetitions, first failing verdict
    EXPECT_TRUE(table[3].starts_with("t2 "));
    EXPECT_NE(table[3].find("3.000 ms load error"), std::string::npos);
    // B never ran t2
    EXPECT_TRUE(table[3].ends_with("-"));

    // columns line up
    EXPECT_EQ(table[0].size(), table[2].size());
    EXPECT_EQ(table[2].size(), table[3].size());
}

TEST(ReportTable, summary)
{
    BenchmarkAggregator aggregator;
    aggregator.record(make_record("A", "t1", Pass{}, 1ms));
    aggregator.record(make_record("A", "t2", Timeout{}, 3ms));
    auto const table = lines(render_summary_table(aggregator.get_summaries()));
    ASSERT_EQ(table.size(), 3);
    EXPECT_NE(table[0].find("passed"), std::string::npos);
    EXPECT_TRUE(table[2].starts_with("A "));
    EXPECT_NE(table[2].find("50.0%"), std::string::npos);
    EXPECT_NE(table[2].find("2.000"), std::string::npos);
}

TEST(ReportTable, failures)
{
    std::vector<RunRecord> const records = {
        make_record("A", "t1", Pass{}, 1ms),
        make_record("B", "t1", ToolError{.exit_code = 1, .stderr_text = "oops"}, 1ms),
    };
    EXPECT_EQ(render_failures(records), "B t1: tool error: exit code 1: oops\n");
    EXPECT_TRUE(render_failures({}).empty());
}
