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

#include <atomic>
#include <cstdint>

TESTETH_NAMESPACE_BEGIN

/// Test-and-test-and-set lock for short critical sections (a single
/// container append); satisfies Lockable so it works with std::lock_guard
class SpinLock
{
    static constexpr uint64_t backoff_start = 100;

    std::atomic<bool> state_{false};

public:
    bool try_lock()
    {
        return !state_.exchange(true, std::memory_order_acquire);
    }

    void lock()
    {
        if (!try_lock()) {
            lock_slow();
        }
    }

    void unlock()
    {
        state_.store(false, std::memory_order_release);
    }

private:
    void lock_slow()
    {
        uint64_t spin = 0;
        do {
            while (state_.load(std::memory_order_relaxed)) {
                if (++spin > backoff_start) {
                    backoff();
                }
            }
        }
        while (!try_lock());
    }

    static void backoff()
    {
#ifdef __x86_64__
        __builtin_ia32_pause();
#else
        __asm__ __volatile__("" : : : "memory");
#endif
    }
};

TESTETH_NAMESPACE_END
