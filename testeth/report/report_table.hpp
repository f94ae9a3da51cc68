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
#include <testeth/bench/run_record.hpp>
#include <testeth/core/config.hpp>

#include <map>
#include <string>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/**
 * One row per test in first seen order, one column per tool in `tools`
 * order. A cell holds the mean duration over the repetitions in
 * milliseconds and the verdict; the first non passing verdict wins.
 */
std::string render_results_table(
    std::vector<RunRecord> const &, std::vector<std::string> const &tools);

std::string render_summary_table(std::map<std::string, ToolSummary> const &);

/// One line per record whose verdict is not Pass
std::string render_failures(std::vector<RunRecord> const &);

TESTETH_NAMESPACE_END
