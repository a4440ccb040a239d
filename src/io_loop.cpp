//
// Reading and decoding output of the child process.
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
#include "io_loop.h"

#include <errno.h>
#include <string.h>
#include <sys/select.h>

#include <iostream>
#include <string>

#include "host_surface.h"
#include "pty_session.h"
#include "shared_file.h"
#include "terminal_state.h"

IoLoop::IoLoop(PtySession &pty, SharedFile &shared_file, std::unique_ptr<TerminalState> &terminal,
               HostSurface &host, size_t chunk_size)
    : pty(pty), shared_file(shared_file), terminal(terminal), host(host), buffer(chunk_size)
{
}

bool IoLoop::poll(int timeout_ms)
{
    if (finished)
        return false;

    if (wait_readable(timeout_ms))
        step();
    return !finished;
}

bool IoLoop::wait_readable(int timeout_ms)
{
    int fd = pty.get_fd();
    if (fd == -1)
        return true; // Let step() notice the closed descriptor

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);
    struct timeval tv = { timeout_ms / 1000, (timeout_ms % 1000) * 1000 };

    return select(fd + 1, &read_fds, nullptr, nullptr, &tv) > 0 && FD_ISSET(fd, &read_fds);
}

void IoLoop::step()
{
    ssize_t bytes = pty.read(buffer.data(), buffer.size());
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
        return;

    if (bytes <= 0) {
        // On Linux, the master reports EIO once the child has closed the terminal.
        if (bytes < 0 && errno != EIO) {
            std::cerr << "Error reading from pty: " << strerror(errno) << std::endl;
        }
        finish();
        return;
    }

    std::string text = decoder.decode(buffer.data(), bytes);
    if (text.empty() || !terminal)
        return;

    terminal->feed(text);

    // Redraw dirty lines only.
    for (int row : terminal->get_dirty_rows()) {
        Region region;
        region.y      = row;
        region.width  = terminal->get_cols();
        region.height = 1;
        host.refresh(region);
    }
}

void IoLoop::finish()
{
    finished = true;
    pty.close();
    pty.reap();

    std::string content;
    if (!shared_file.read_all(content)) {
        content.clear();
    }
    if (terminal) {
        terminal->freeze(split_lines(content));
    }
    host.refresh();
}

void IoLoop::cancel()
{
    if (finished)
        return;
    finished = true;
    pty.close();
    pty.reap();
}
