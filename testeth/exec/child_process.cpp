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

#include <testeth/exec/child_process.hpp>

#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/exec/unique_fd.hpp>

#include <quill/Quill.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

TESTETH_ANONYMOUS_NAMESPACE_BEGIN

struct Pipe
{
    UniqueFd read;
    UniqueFd write;
};

int make_pipe(Pipe &p)
{
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return errno;
    }
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return 0;
}

void set_nonblocking(int const fd)
{
    int const flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Runs in the forked child: only async-signal-safe calls until exec
[[noreturn]] void exec_child(
    char *const *const argv, Pipe const &in, Pipe const &out, Pipe const &err,
    int const report_fd)
{
    ::setpgid(0, 0);
    // an ignored disposition would survive exec
    ::signal(SIGPIPE, SIG_DFL);

    if (::dup2(in.read.get(), STDIN_FILENO) < 0 ||
        ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
        ::dup2(err.write.get(), STDERR_FILENO) < 0) {
        int const e = errno;
        (void)!::write(report_fd, &e, sizeof(e));
        ::_exit(127);
    }

    ::execv(argv[0], argv);

    int const e = errno;
    (void)!::write(report_fd, &e, sizeof(e));
    ::_exit(127);
}

TESTETH_ANONYMOUS_NAMESPACE_END

TESTETH_NAMESPACE_BEGIN

Result<ChildProcess> ChildProcess::spawn(std::vector<std::string> const &argv)
{
    // everything the child touches is built before fork
    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (auto const &arg : argv) {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    Pipe in;
    Pipe out;
    Pipe err;
    Pipe report;
    for (Pipe *const p : {&in, &out, &err, &report}) {
        if (int const e = make_pipe(*p); e != 0) {
            LOG_ERROR("pipe failed: {}", std::strerror(e));
            return outcome_e::posix_code(e);
        }
    }

    pid_t const pid = ::fork();
    if (pid < 0) {
        int const e = errno;
        LOG_ERROR("fork failed: {}", std::strerror(e));
        return outcome_e::posix_code(e);
    }
    if (pid == 0) {
        exec_child(c_argv.data(), in, out, err, report.write.get());
    }

    // mirror the child's setpgid so killpg works before it runs
    ::setpgid(pid, pid);

    ChildProcess child;
    child.pid_ = pid;

    in.read.reset();
    out.write.reset();
    err.write.reset();
    report.write.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(report.read.get(), &exec_errno, sizeof(exec_errno));
    }
    while (n < 0 && errno == EINTR);
    if (n > 0) {
        child.terminate();
        LOG_ERROR("exec {} failed: {}", argv[0], std::strerror(exec_errno));
        return outcome_e::posix_code(exec_errno);
    }

    child.stdin_ = std::move(in.write);
    child.stdout_ = std::move(out.read);
    child.stderr_ = std::move(err.read);
    set_nonblocking(child.stdin_.get());
    set_nonblocking(child.stdout_.get());
    set_nonblocking(child.stderr_.get());
    return child;
}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : pid_{std::exchange(other.pid_, -1)}
    , reaped_{std::exchange(other.reaped_, true)}
    , wait_status_{other.wait_status_}
    , stdin_{std::move(other.stdin_)}
    , stdout_{std::move(other.stdout_)}
    , stderr_{std::move(other.stderr_)}
{
}

ChildProcess::~ChildProcess()
{
    terminate();
}

bool ChildProcess::has_exited()
{
    if (pid_ < 0 || reaped_) {
        return true;
    }
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info,
                      WEXITED | WNOHANG | WNOWAIT);
    }
    while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        // ECHILD: nothing left to wait for
        return true;
    }
    return info.si_pid == pid_;
}

void ChildProcess::kill_group() noexcept
{
    if (pid_ < 0 || reaped_) {
        return;
    }
    // the group outlives a leader that is still unreaped, so this also
    // catches grandchildren left behind after a normal exit
    ::killpg(pid_, SIGKILL);
}

void ChildProcess::terminate() noexcept
{
    if (pid_ < 0 || reaped_) {
        return;
    }
    stdin_.reset();
    kill_group();
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, 0);
    }
    while (rc < 0 && errno == EINTR);
    wait_status_ = rc == pid_ ? status : 0;
    reaped_ = true;
    stdout_.reset();
    stderr_.reset();
}

std::optional<int> ChildProcess::wait_status() const noexcept
{
    if (!reaped_ || pid_ < 0) {
        return std::nullopt;
    }
    return wait_status_;
}

TESTETH_NAMESPACE_END
