//
// Terminal state: decoded screen contents and change tracking.
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
#ifndef TERMINAL_STATE_H
#define TERMINAL_STATE_H

#include <gtest/gtest_prod.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cell_style.h"
#include "decode_engine.h"
#include "line_cache.h"

//
// Screen of one session for a fixed geometry. Tracks which rows need to be
// rendered again, and keeps styled rows between renders. After the session
// ends, the screen is frozen to the final text of the file.
//
class TerminalState {
public:
    explicit TerminalState(std::unique_ptr<DecodeEngine> engine);

    // Interpret output of the child process.
    void feed(const std::string &text);

    // Styled contents of row y.
    StyledLine get_line(int y);

    // Show static text from now on.
    void freeze(const std::vector<std::string> &content);

    bool is_frozen() const { return frozen; }
    const std::vector<std::string> &get_frozen_content() const { return frozen_content; }
    const std::set<int> &get_dirty_rows() const { return dirty_rows; }
    int get_cols() const { return engine->cols(); }
    int get_rows() const { return engine->rows(); }

private:
    // Declare test cases as friends
    FRIEND_TEST(TerminalStateTest, AllRowsDirtyInitially);
    FRIEND_TEST(TerminalStateTest, CursorMoveMarksBothRows);
    FRIEND_TEST(TerminalStateTest, EngineDirtyRowsMergedAndCleared);
    FRIEND_TEST(TerminalStateTest, DirtyRowRecomputed);
    FRIEND_TEST(TerminalStateTest, FreezeIgnoresFeed);

    std::unique_ptr<DecodeEngine> engine;
    LineCache cache;
    std::set<int> dirty_rows;
    Cursor last_cursor;
    bool cursor_known{};
    bool frozen{};
    std::vector<std::string> frozen_content;

    void mark_dirty(int row);
    StyledLine render_row(int y) const;
};

#endif // TERMINAL_STATE_H
