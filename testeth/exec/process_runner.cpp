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

#include <testeth/exec/process_runner.hpp>

#include <testeth/core/byte_string.hpp>
#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/exec/child_process.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/exec/unique_fd.hpp>
#include <testeth/registry/tool_entry.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

using Clock = std::chrono::steady_clock;

constexpr auto POLL_INTERVAL = std::chrono::milliseconds{20};
constexpr auto EXIT_POLL_INTERVAL = std::chrono::milliseconds{1};

struct Capture
{
    std::string &text;
    bool &truncated;
};

/// Reads what is available; closes the stream on EOF or failure
void drain_into(UniqueFd &fd, Capture const capture, size_t const max_bytes)
{
    std::array<char, 16384> buf;
    for (;;) {
        ssize_t const n = ::read(fd.get(), buf.data(), buf.size());
        if (n > 0) {
            auto const room = max_bytes - std::min(max_bytes, capture.text.size());
            auto const keep = std::min(room, static_cast<size_t>(n));
            capture.text.append(buf.data(), keep);
            if (keep < static_cast<size_t>(n)) {
                capture.truncated = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.reset();
        return;
    }
}

/// Writes what the pipe accepts; closes stdin once all input is written or
/// the child stopped reading
void feed(UniqueFd &fd, byte_string_view &pending)
{
    while (!pending.empty()) {
        ssize_t const n = ::write(fd.get(), pending.data(), pending.size());
        if (n > 0) {
            pending.remove_prefix(static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the child does not want its input
        break;
    }
    fd.reset();
}

void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

TESTETH_ANONYMOUS_NAMESPACE_END

TESTETH_NAMESPACE_BEGIN

ProcessRunner::ProcessRunner(size_t const max_output_bytes)
    : max_output_bytes_{max_output_bytes}
{
    ignore_sigpipe();
}

std::vector<std::string> ProcessRunner::command_line(
    ToolEntry const &tool, std::span<std::string const> const per_test_args)
{
    std::vector<std::string> argv;
    argv.reserve(1 + tool.args.size() + per_test_args.size());
    argv.push_back(tool.path.string());
    argv.insert(argv.end(), tool.args.begin(), tool.args.end());
    argv.insert(argv.end(), per_test_args.begin(), per_test_args.end());
    return argv;
}

Result<RawOutcome> ProcessRunner::run(
    ToolEntry const &tool, std::span<std::string const> const per_test_args,
    byte_string_view input, std::chrono::nanoseconds const timeout,
    std::stop_token const stop) const
{
    auto const begin = Clock::now();
    auto const deadline = timeout.count() > 0
                              ? begin + timeout
                              : Clock::time_point::max();

    BOOST_OUTCOME_TRY(
        auto child, ChildProcess::spawn(command_line(tool, per_test_args)));

    RawOutcome outcome;
    outcome.pid = child.pid();
    Capture const out{outcome.stdout_text, outcome.stdout_truncated};
    Capture const err{outcome.stderr_text, outcome.stderr_truncated};

    if (input.empty()) {
        child.stdin_fd().reset();
    }

    auto const expired = [&] {
        if (stop.stop_requested()) {
            outcome.cancelled = true;
            return true;
        }
        if (Clock::now() >= deadline) {
            outcome.timed_out = true;
            return true;
        }
        return false;
    };

    // pump stdio until the child exits; descendants that inherited its
    // stdout or stderr do not hold the run open
    for (;;) {
        if (expired()) {
            break;
        }
        if (child.has_exited()) {
            outcome.duration = Clock::now() - begin;
            child.kill_group();
            // what the child wrote before exiting is still in the pipes
            if (child.stdout_fd()) {
                drain_into(child.stdout_fd(), out, max_output_bytes_);
            }
            if (child.stderr_fd()) {
                drain_into(child.stderr_fd(), err, max_output_bytes_);
            }
            break;
        }
        if (!child.stdout_fd() && !child.stderr_fd()) {
            child.stdin_fd().reset();
        }

        std::array<pollfd, 3> fds{};
        nfds_t nfds = 0;
        auto const add = [&](UniqueFd const &fd, short const events) {
            if (fd) {
                fds[nfds++] = pollfd{.fd = fd.get(), .events = events, .revents = 0};
            }
        };
        add(child.stdout_fd(), POLLIN);
        add(child.stderr_fd(), POLLIN);
        add(child.stdin_fd(), POLLOUT);

        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        // with every stream closed only the exit is left to wait for
        auto const interval = nfds ? POLL_INTERVAL : EXIT_POLL_INTERVAL;
        auto const wait = std::clamp(
            remaining, std::chrono::milliseconds{0}, interval);
        int const rc = ::poll(fds.data(), nfds, static_cast<int>(wait.count()));
        if (rc < 0 && errno != EINTR) {
            LOG_ERROR("poll failed for {}: errno {}", tool.name, errno);
            std::this_thread::sleep_for(interval);
            continue;
        }
        if (rc <= 0) {
            continue;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) {
                continue;
            }
            if (fds[i].fd == child.stdout_fd().get()) {
                drain_into(child.stdout_fd(), out, max_output_bytes_);
            }
            else if (fds[i].fd == child.stderr_fd().get()) {
                drain_into(child.stderr_fd(), err, max_output_bytes_);
            }
            else if (fds[i].fd == child.stdin_fd().get()) {
                feed(child.stdin_fd(), input);
            }
        }
    }

    if (outcome.timed_out || outcome.cancelled) {
        outcome.duration = Clock::now() - begin;
    }
    child.terminate();

    if (outcome.timed_out || outcome.cancelled) {
        outcome.exit_code = -1;
        return outcome;
    }

    int const status = child.wait_status().value_or(0);
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
        outcome.exit_code = 128 + outcome.term_signal;
    }
    return outcome;
}

TESTETH_NAMESPACE_END
