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
#ifndef PTY_SESSION_H
#define PTY_SESSION_H

#include <sys/types.h>

#include <stdexcept>
#include <string>
#include <vector>

// Child program cannot be started.
class SpawnError : public std::runtime_error {
public:
    explicit SpawnError(const std::string &message) : std::runtime_error(message) {}
};

//
// Owns the child process and the master side of its pseudo-terminal.
// Destruction closes the descriptor and reaps the child.
//
class PtySession {
public:
    PtySession() = default;
    ~PtySession();
    PtySession(const PtySession &) = delete;
    PtySession &operator=(const PtySession &) = delete;

    // Start program argv[0] on a new pseudo-terminal of given size,
    // with exactly the given environment (NAME=value strings).
    // Throws SpawnError when the program cannot be executed.
    void spawn(const std::vector<std::string> &argv, const std::vector<std::string> &env,
               int cols, int rows);

    // Set window size of the terminal.
    bool resize(int cols, int rows);

    // Non-blocking read from the master descriptor.
    ssize_t read(char *buffer, size_t size);

    // Send all data to the child.
    bool write(const std::string &data);

    // Close the master descriptor.
    void close();

    // Wait for the child to exit, terminating it if still running.
    void reap();

    bool is_open() const { return master_fd != -1; }
    int get_fd() const { return master_fd; }
    pid_t get_pid() const { return child_pid; }

private:
    int master_fd{ -1 };
    pid_t child_pid{ -1 };

    bool wait_writable();
};

#endif // PTY_SESSION_H
