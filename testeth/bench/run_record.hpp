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

#include <testeth/compare/verdict.hpp>
#include <testeth/core/config.hpp>

#include <chrono>
#include <optional>
#include <string>

TESTETH_NAMESPACE_BEGIN

/// One (tool, test, repetition) outcome
struct RunRecord
{
    std::string tool_name;
    std::string test_id;
    Verdict verdict;
    // wall clock of the child process, measured by the harness
    std::chrono::nanoseconds duration{0};
    // the tool's own measurement, when reported
    std::optional<std::chrono::nanoseconds> reported_duration{};
    unsigned repetition{0};
};

TESTETH_NAMESPACE_END
