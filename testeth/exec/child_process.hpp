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
#include <testeth/core/result.hpp>
#include <testeth/exec/unique_fd.hpp>

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

TESTETH_NAMESPACE_BEGIN

/// A spawned child that leads its own process group. The handle owns the
/// parent side of the child's stdio pipes; teardown kills the whole group
/// and reaps the child, so no process outlives the handle.
class ChildProcess
{
    pid_t pid_{-1};
    bool reaped_{false};
    int wait_status_{0};

    UniqueFd stdin_{};
    UniqueFd stdout_{};
    UniqueFd stderr_{};

    ChildProcess() = default;

public:
    /// `argv[0]` is the executable path. Fails with the errno of the pipe,
    /// fork or exec call that went wrong; an exec failure is detected
    /// through a close-on-exec error pipe before this returns.
    static Result<ChildProcess> spawn(std::vector<std::string> const &argv);

    ChildProcess(ChildProcess &&) noexcept;
    ChildProcess &operator=(ChildProcess &&) = delete;
    ChildProcess(ChildProcess const &) = delete;
    ChildProcess &operator=(ChildProcess const &) = delete;

    ~ChildProcess();

    pid_t pid() const noexcept
    {
        return pid_;
    }

    UniqueFd &stdin_fd() noexcept
    {
        return stdin_;
    }

    UniqueFd &stdout_fd() noexcept
    {
        return stdout_;
    }

    UniqueFd &stderr_fd() noexcept
    {
        return stderr_;
    }

    /// True once the child has terminated; it stays unreaped so its process
    /// group id cannot be recycled before `terminate`
    bool has_exited();

    /// SIGKILL to the process group without reaping; the pipes stay open so
    /// output already written can still be read
    void kill_group() noexcept;

    /// SIGKILL to the process group, then reap. Idempotent.
    void terminate() noexcept;

    /// Raw waitpid status, valid after `terminate`
    std::optional<int> wait_status() const noexcept;
};

TESTETH_NAMESPACE_END
