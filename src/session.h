//
// Embedded terminal program session.
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
#ifndef SESSION_H
#define SESSION_H

#include <gtest/gtest_prod.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "cell_style.h"
#include "decode_engine.h"
#include "host_surface.h"
#include "input_forwarder.h"
#include "io_loop.h"
#include "pty_session.h"
#include "shared_file.h"
#include "terminal_state.h"

// Options of the embedded program
struct SessionOptions {
    std::string command{ "vim" };         // Program with arguments; file name is appended
    std::string editor_env;               // When set, take command from this variable
    std::string language;                 // File suffix without dot; ".txt" when empty
    std::string content;                  // Initial contents of the file
    bool has_content{};                   // Write content before start
    std::string term_type{ "linux" };     // TERM of the child
    std::string locale{ "en_GB.UTF-8" };  // LC_ALL of the child
    size_t read_chunk_size{ 65536 };      // Maximum bytes per read
};

// Lifecycle of a session, strictly in this order
enum class SessionState { CREATED, SPAWNED, RUNNING, TERMINATED };

//
// One embedded program shown on a host surface.
// The program starts once the host has reported its size, and edits
// a temporary file; when it exits, the panel shows the final text
// of the file and ignores input.
//
class Session {
public:
    Session(const SessionOptions &options, HostSurface &host,
            EngineFactory engine_factory = make_default_engine);
    ~Session();
    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    // Host events
    void on_resize(int cols, int rows);
    void on_key(KeyInput &key);
    void on_mouse(MouseInput &mouse);

    // Styled contents of row y of the panel.
    StyledLine render_line(int y);

    // Access to the file, only while the program is not running.
    bool get_text(std::string &text) const;
    bool set_text(const std::string &text);

    // Start the program when possible, and handle its output.
    // Returns false once the session has terminated.
    bool poll(int timeout_ms);

    SessionState get_state() const { return state; }
    const std::string &get_suffix() const { return suffix; }
    const std::string &get_file_path() const { return shared_file.get_path(); }
    int get_cols() const { return term_cols; }
    int get_rows() const { return term_rows; }

    static std::unique_ptr<DecodeEngine> make_default_engine(int cols, int rows);

private:
    // Declare test cases as friends
    FRIEND_TEST(SessionTest, ResizeDiscardsDirtyRowsAndCache);
    FRIEND_TEST(SessionTest, ResizeBeforeSpawnIsDeferred);
    FRIEND_TEST(SessionTest, InputIgnoredAfterTermination);
    FRIEND_TEST(SessionTest, TeardownReapsChild);
    FRIEND_TEST(SessionTest, MouseOutsideGridNotForwarded);

    SessionOptions options;
    HostSurface &host;
    EngineFactory engine_factory;
    std::string suffix;
    int term_cols{};
    int term_rows{};
    SessionState state{ SessionState::CREATED };
    bool resize_pending{};

    // Destroyed in reverse order: the child is reaped before the file is removed.
    SharedFile shared_file;
    std::unique_ptr<TerminalState> terminal;
    PtySession pty;
    IoLoop io_loop;
    InputForwarder forwarder;

    void start();
    void advance(SessionState next);
    bool build_argv(std::vector<std::string> &argv) const;
    std::vector<std::string> build_env() const;
};

#endif // SESSION_H
