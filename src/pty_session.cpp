//
// Child process attached to a pseudo-terminal.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include "pty_session.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <iostream>

extern char **environ;

// How long a child gets to exit after SIGTERM, in 10 msec steps.
static const int terminate_wait_steps = 100;

//
// Pass errno of the failed call to the parent, and quit.
// Runs in the child after fork().
//
static void report_child_failure(int status_fd)
{
    int code      = errno;
    ssize_t bytes = ::write(status_fd, &code, sizeof(code));
    (void)bytes;
    _exit(127);
}

PtySession::~PtySession()
{
    close();
    reap();
}

void PtySession::spawn(const std::vector<std::string> &argv, const std::vector<std::string> &env,
                       int cols, int rows)
{
    if (argv.empty() || argv[0].empty()) {
        throw SpawnError("Empty command");
    }

    master_fd = posix_openpt(O_RDWR | O_NOCTTY);
    if (master_fd == -1) {
        throw SpawnError(std::string("Error opening pseudo-terminal: ") + strerror(errno));
    }
    if (grantpt(master_fd) == -1 || unlockpt(master_fd) == -1) {
        std::string message = std::string("PTY setup failed: ") + strerror(errno);
        close();
        throw SpawnError(message);
    }

    const char *slave_name = ptsname(master_fd);
    if (!slave_name) {
        std::string message = std::string("Error getting slave name: ") + strerror(errno);
        close();
        throw SpawnError(message);
    }
    std::string slave_path = slave_name;

    // Child writes errno here when exec fails; a successful exec closes it.
    int status_pipe[2];
    if (pipe(status_pipe) == -1) {
        std::string message = std::string("Error creating pipe: ") + strerror(errno);
        close();
        throw SpawnError(message);
    }
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    // Prepare arguments before fork: no allocation in the child.
    std::vector<char *> c_argv;
    for (const auto &arg : argv) {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    std::vector<char *> c_env;
    for (const auto &var : env) {
        c_env.push_back(const_cast<char *>(var.c_str()));
    }
    c_env.push_back(nullptr);

    child_pid = fork();
    if (child_pid == -1) {
        std::string message = std::string("Error forking: ") + strerror(errno);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        close();
        throw SpawnError(message);
    }

    if (child_pid == 0) {
        ::close(status_pipe[0]);
        ::close(master_fd);
        if (setsid() == -1)
            report_child_failure(status_pipe[1]);

        int slave_fd = open(slave_path.c_str(), O_RDWR);
        if (slave_fd == -1)
            report_child_failure(status_pipe[1]);

        struct winsize ws = {};
        ws.ws_col         = cols;
        ws.ws_row         = rows;
        if (ioctl(slave_fd, TIOCSCTTY, 0) == -1 || ioctl(slave_fd, TIOCSWINSZ, &ws) == -1)
            report_child_failure(status_pipe[1]);

        dup2(slave_fd, STDIN_FILENO);
        dup2(slave_fd, STDOUT_FILENO);
        dup2(slave_fd, STDERR_FILENO);
        if (slave_fd > 2)
            ::close(slave_fd);

        signal(SIGPIPE, SIG_DFL);
        environ = c_env.data();
        execvp(c_argv[0], c_argv.data());
        report_child_failure(status_pipe[1]);
    }

    ::close(status_pipe[1]);
    int child_errno = 0;
    ssize_t bytes;
    do {
        bytes = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes == -1 && errno == EINTR);
    ::close(status_pipe[0]);

    if (bytes == sizeof(child_errno)) {
        close();
        reap();
        throw SpawnError("Cannot execute " + argv[0] + ": " + strerror(child_errno));
    }

    fcntl(master_fd, F_SETFD, FD_CLOEXEC);
    fcntl(master_fd, F_SETFL, fcntl(master_fd, F_GETFL) | O_NONBLOCK);
}

bool PtySession::resize(int cols, int rows)
{
    if (master_fd == -1)
        return false;

    struct winsize ws = {};
    ws.ws_col         = cols;
    ws.ws_row         = rows;
    if (ioctl(master_fd, TIOCSWINSZ, &ws) == -1)
        return false;

    if (child_pid > 0) {
        kill(child_pid, SIGWINCH);
    }
    return true;
}

ssize_t PtySession::read(char *buffer, size_t size)
{
    if (master_fd == -1) {
        errno = EBADF;
        return -1;
    }
    return ::read(master_fd, buffer, size);
}

bool PtySession::wait_writable()
{
    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(master_fd, &write_fds);
    struct timeval tv = { 1, 0 };

    return select(master_fd + 1, nullptr, &write_fds, nullptr, &tv) > 0;
}

bool PtySession::write(const std::string &data)
{
    if (master_fd == -1)
        return false;

    size_t done = 0;
    while (done < data.size()) {
        ssize_t bytes = ::write(master_fd, data.data() + done, data.size() - done);
        if (bytes < 0) {
            if (errno == EINTR)
                continue;
            if ((errno == EAGAIN || errno == EWOULDBLOCK) && wait_writable())
                continue;
            return false;
        }
        done += bytes;
    }
    return true;
}

void PtySession::close()
{
    if (master_fd != -1) {
        ::close(master_fd);
        master_fd = -1;
    }
}

void PtySession::reap()
{
    if (child_pid <= 0)
        return;

    int status;
    pid_t result = waitpid(child_pid, &status, WNOHANG);
    if (result == 0) {
        kill(child_pid, SIGTERM);
        for (int i = 0; i < terminate_wait_steps; ++i) {
            result = waitpid(child_pid, &status, WNOHANG);
            if (result != 0)
                break;
            usleep(10000);
        }
        if (result == 0) {
            kill(child_pid, SIGKILL);
            result = waitpid(child_pid, &status, 0);
        }
    }
    if (result == -1 && errno != ECHILD) {
        std::cerr << "Error waiting for child: " << strerror(errno) << std::endl;
    }
    child_pid = -1;
}
