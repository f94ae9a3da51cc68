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

#include <testeth/compare/result_comparator.hpp>
#include <testeth/core/config.hpp>
#include <testeth/exec/process_runner.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <thread>

TESTETH_NAMESPACE_BEGIN

inline unsigned default_pool_size()
{
    return std::max(1u, std::thread::hardware_concurrency());
}

struct RunConfig
{
    unsigned pool_size{default_pool_size()};
    // zero disables the limit
    std::chrono::nanoseconds timeout{std::chrono::seconds{10}};
    unsigned repetitions{1};
    size_t max_output_bytes{DEFAULT_MAX_OUTPUT_BYTES};
    LogOrder log_order{LogOrder::Strict};
};

TESTETH_NAMESPACE_END
