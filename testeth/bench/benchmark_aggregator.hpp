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

#include <testeth/bench/run_record.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/spin_lock.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

TESTETH_NAMESPACE_BEGIN

struct ToolSummary
{
    size_t count{0};
    size_t passes{0};
    double pass_rate{0};
    std::chrono::nanoseconds mean{0};
    std::chrono::nanoseconds min{0};
    std::chrono::nanoseconds max{0};
    std::chrono::nanoseconds median{0};
    std::chrono::nanoseconds stddev{0};
};

/// Append-only collection of run records. `record` may be called from any
/// worker; the readers assume no run is in flight.
class BenchmarkAggregator
{
    mutable SpinLock lock_;
    std::vector<RunRecord> records_;

public:
    void record(RunRecord);

    std::vector<RunRecord> get_records() const;

    /// Statistics over every record of `tool_name`; all zero if it has none
    ToolSummary summarize(std::string_view tool_name) const;

    std::map<std::string, ToolSummary> get_summaries() const;

    void clear();
};

TESTETH_NAMESPACE_END
