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

#include <chrono>
#include <string>

#include <sys/types.h>

TESTETH_NAMESPACE_BEGIN

struct RawOutcome
{
    std::string stdout_text{};
    std::string stderr_text{};
    // 128 + signal number when the child was killed by a signal
    int exit_code{0};
    int term_signal{0};
    std::chrono::nanoseconds duration{0};
    bool timed_out{false};
    bool cancelled{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    pid_t pid{-1};
};

TESTETH_NAMESPACE_END
