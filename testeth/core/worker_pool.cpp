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

#include <testeth/core/worker_pool.hpp>

#include <testeth/core/assert.h>
#include <testeth/core/config.hpp>

#include <boost/fiber/channel_op_status.hpp>

#include <cstdio>
#include <functional>
#include <thread>
#include <utility>

#include <pthread.h>

TESTETH_NAMESPACE_BEGIN

WorkerPool::WorkerPool(unsigned const n_threads)
{
    TESTETH_ASSERT(n_threads);

    threads_.reserve(n_threads);
    for (unsigned i = 0; i < n_threads; ++i) {
        auto thread = std::thread([this, i] {
            char name[16];
            std::snprintf(name, 16, "worker %u", i);
            pthread_setname_np(pthread_self(), name);
            std::function<void()> task;
            while (channel_.pop(task) ==
                   boost::fibers::channel_op_status::success) {
                task();
                task = nullptr;
            }
        });
        threads_.push_back(std::move(thread));
    }
}

WorkerPool::~WorkerPool()
{
    drain();
}

void WorkerPool::submit(std::function<void()> task)
{
    auto const status = channel_.push(std::move(task));
    TESTETH_ASSERT(
        status == boost::fibers::channel_op_status::success,
        "submit after drain");
}

void WorkerPool::drain()
{
    channel_.close();

    while (threads_.size()) {
        auto &thread = threads_.back();
        thread.join();
        threads_.pop_back();
    }
}

TESTETH_NAMESPACE_END
