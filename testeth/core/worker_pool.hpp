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

#include <boost/fiber/buffered_channel.hpp>

#include <functional>
#include <thread>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/// Fixed set of OS threads draining a shared task channel. Tasks may block
/// (e.g. waiting on a child process); each one occupies its thread only.
class WorkerPool final
{
    boost::fibers::buffered_channel<std::function<void()>> channel_{1024};

    std::vector<std::thread> threads_{};

public:
    explicit WorkerPool(unsigned n_threads);

    WorkerPool(WorkerPool const &) = delete;
    WorkerPool &operator=(WorkerPool const &) = delete;

    /// Drains every submitted task, then joins the threads
    ~WorkerPool();

    unsigned size() const noexcept
    {
        return static_cast<unsigned>(threads_.size());
    }

    /// Blocks while the channel is full
    void submit(std::function<void()> task);

    /// Closes the channel and waits for all queued tasks to finish
    void drain();
};

TESTETH_NAMESPACE_END
