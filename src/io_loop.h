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
#ifndef IO_LOOP_H
#define IO_LOOP_H

#include <cstddef>
#include <memory>
#include <vector>

#include "utf8_decoder.h"

class HostSurface;
class PtySession;
class SharedFile;
class TerminalState;

//
// Moves output of the child process to the terminal state.
// Runs on the UI thread: each poll() waits for the descriptor
// at most for the given time, then handles one chunk of data.
// When the child is gone, the screen is frozen to the final
// contents of the shared file.
//
class IoLoop {
public:
    IoLoop(PtySession &pty, SharedFile &shared_file, std::unique_ptr<TerminalState> &terminal,
           HostSurface &host, size_t chunk_size);

    // Returns false when the loop has finished.
    bool poll(int timeout_ms);

    // Stop without freezing: close the descriptor and reap the child.
    void cancel();

    bool is_finished() const { return finished; }

private:
    PtySession &pty;
    SharedFile &shared_file;
    std::unique_ptr<TerminalState> &terminal;
    HostSurface &host;
    std::vector<char> buffer;
    Utf8Decoder decoder;
    bool finished{};

    bool wait_readable(int timeout_ms);
    void step();
    void finish();
};

#endif // IO_LOOP_H
