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

#include <testeth/core/byte_string.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/registry/tool_entry.hpp>

#include <chrono>
#include <cstddef>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

TESTETH_NAMESPACE_BEGIN

inline constexpr size_t DEFAULT_MAX_OUTPUT_BYTES = 64 * 1024 * 1024;

/// Runs one tool invocation to completion. Thread safe; every call owns its
/// child process exclusively.
class ProcessRunner
{
    size_t max_output_bytes_;

public:
    explicit ProcessRunner(size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES);

    /**
     * Spawns `tool.path tool.args... per_test_args...`, feeds `input` on
     * stdin and collects stdout and stderr until the child exits.
     * @param timeout zero disables the limit
     * @return the outcome, also when the child failed, timed out or was
     * cancelled; an error only when the child could not be started
     */
    Result<RawOutcome> run(
        ToolEntry const &tool, std::span<std::string const> per_test_args,
        byte_string_view input, std::chrono::nanoseconds timeout,
        std::stop_token stop = {}) const;

    static std::vector<std::string> command_line(
        ToolEntry const &, std::span<std::string const> per_test_args);
};

TESTETH_NAMESPACE_END
