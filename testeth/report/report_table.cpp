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

#include <testeth/report/report_table.hpp>

#include <testeth/bench/benchmark_aggregator.hpp>
#include <testeth/bench/run_record.hpp>
#include <testeth/compare/verdict.hpp>
#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/config.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t CELL_WIDTH = 24;

struct Cell
{
    std::chrono::nanoseconds total{0};
    size_t count{0};
    std::optional<VerdictKind> verdict{};
};

double to_ms(std::chrono::nanoseconds const ns)
{
    return std::chrono::duration<double, std::milli>(ns).count();
}

TESTETH_ANONYMOUS_NAMESPACE_END

TESTETH_NAMESPACE_BEGIN

std::string render_results_table(
    std::vector<RunRecord> const &records, std::vector<std::string> const &tools)
{
    std::vector<std::string> tests;
    std::map<std::pair<std::string, std::string>, Cell> cells;
    for (auto const &r : records) {
        if (std::find(tests.begin(), tests.end(), r.test_id) == tests.end()) {
            tests.push_back(r.test_id);
        }
        auto &cell = cells[{r.test_id, r.tool_name}];
        cell.total += r.duration;
        ++cell.count;
        if (!cell.verdict.has_value() || *cell.verdict == VerdictKind::Pass) {
            cell.verdict = kind(r.verdict);
        }
    }

    size_t w = 4;
    for (auto const &test : tests) {
        w = std::max(w, test.size());
    }

    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "{:<{}}", "test", w);
    for (auto const &tool : tools) {
        fmt::format_to(it, " | {:>{}}", tool, CELL_WIDTH);
    }
    fmt::format_to(it, "\n{}\n", std::string(w + tools.size() * (CELL_WIDTH + 3), '-'));

    for (auto const &test : tests) {
        fmt::format_to(it, "{:<{}}", test, w);
        for (auto const &tool : tools) {
            auto const c = cells.find({test, tool});
            if (c == cells.end()) {
                fmt::format_to(it, " | {:>{}}", "-", CELL_WIDTH);
                continue;
            }
            auto const &cell = c->second;
            auto const mean = cell.total / static_cast<long>(cell.count);
            fmt::format_to(
                it,
                " | {:>{}}",
                fmt::format(
                    "{:.3f} ms {}",
                    to_ms(mean),
                    std::string{to_string(*cell.verdict)}),
                CELL_WIDTH);
        }
        out.push_back('\n');
    }
    return out;
}

std::string
render_summary_table(std::map<std::string, ToolSummary> const &summaries)
{
    size_t w = 4;
    for (auto const &[tool, _] : summaries) {
        w = std::max(w, tool.size());
    }

    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(
        it,
        "{:<{}} | {:>6} | {:>6} | {:>7} | {:>12} | {:>12} | {:>12} | {:>12} | "
        "{:>12}\n",
        "tool",
        w,
        "runs",
        "passed",
        "rate",
        "mean ms",
        "min ms",
        "max ms",
        "median ms",
        "stddev ms");
    fmt::format_to(it, "{}\n", std::string(w + 103, '-'));
    for (auto const &[tool, s] : summaries) {
        fmt::format_to(
            it,
            "{:<{}} | {:>6} | {:>6} | {:>6.1f}% | {:>12.3f} | {:>12.3f} | "
            "{:>12.3f} | {:>12.3f} | {:>12.3f}\n",
            tool,
            w,
            s.count,
            s.passes,
            s.pass_rate * 100,
            to_ms(s.mean),
            to_ms(s.min),
            to_ms(s.max),
            to_ms(s.median),
            to_ms(s.stddev));
    }
    return out;
}

std::string render_failures(std::vector<RunRecord> const &records)
{
    std::string out;
    auto it = std::back_inserter(out);
    for (auto const &r : records) {
        if (is_pass(r.verdict)) {
            continue;
        }
        fmt::format_to(
            it, "{} {}: {}\n", r.tool_name, r.test_id, describe(r.verdict));
    }
    return out;
}

TESTETH_NAMESPACE_END
