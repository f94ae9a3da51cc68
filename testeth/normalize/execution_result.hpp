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

#include <testeth/core/config.hpp>
#include <testeth/state/account.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/// Canonical outcome of one tool invocation, independent of the dialect
struct ExecutionResult
{
    State post_state{};
    uint64_t resource_used{0};
    // absent when the dialect does not report logs
    std::optional<std::vector<LogEntry>> logs{};
    std::chrono::nanoseconds raw_duration{0};
    // the tool's own measurement, when its dialect prints one
    std::optional<std::chrono::nanoseconds> reported_duration{};
    int exit_code{0};
    std::string stderr_text{};
};

TESTETH_NAMESPACE_END
