//
// Translation of keyboard and mouse input into terminal byte sequences.
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
#ifndef INPUT_FORWARDER_H
#define INPUT_FORWARDER_H

#include <gtest/gtest_prod.h>

#include <cstddef>
#include <memory>
#include <string>

class PtySession;
class TerminalState;

// Device-independent keycodes
enum class KeyCode {
    // clang-format off
    UNKNOWN,
    ENTER,
    BACKSPACE,
    TAB,
    ESCAPE,
    UP, DOWN, RIGHT, LEFT,
    HOME, END,
    INSERT, DELETE,
    PAGEUP, PAGEDOWN,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    CHARACTER, // For printable characters
    // clang-format on
};

// Structure for key input
struct KeyInput {
    KeyCode code{ KeyCode::UNKNOWN };
    wchar_t character{};
    bool mod_shift{};
    bool mod_ctrl{};
    bool consumed{}; // Set when the event must not propagate further

    KeyInput() = default;
    explicit KeyInput(KeyCode code, bool ctrl = false) : code(code), mod_ctrl(ctrl) {}
    KeyInput(unsigned c, bool shift, bool ctrl)
        : code(KeyCode::CHARACTER), character(c), mod_shift(shift), mod_ctrl(ctrl)
    {
    }
};

// Kinds of mouse events
enum class MouseKind { MOVE, DOWN, UP };

// Structure for mouse input, in cells relative to the panel
struct MouseInput {
    MouseKind kind{ MouseKind::MOVE };
    int x{};
    int y{};
    bool consumed{};

    MouseInput() = default;
    MouseInput(MouseKind kind, int x, int y) : kind(kind), x(x), y(y) {}
};

//
// Sends user input to the child process, until the session is over.
//
class InputForwarder {
public:
    InputForwarder(PtySession &pty, const std::unique_ptr<TerminalState> &terminal);

    void forward_key(KeyInput &key);

    // Positions outside the grid are not reported.
    void forward_mouse(MouseInput &mouse);

    // Byte sequence for a key; empty when the key has no encoding.
    static std::string encode_key(const KeyInput &key);

    // SGR mouse report.
    static std::string encode_mouse(const MouseInput &mouse);

    size_t get_bytes_forwarded() const { return bytes_forwarded; }

private:
    PtySession &pty;
    const std::unique_ptr<TerminalState> &terminal;
    size_t bytes_forwarded{};

    bool session_ended() const;
    bool inside_grid(const MouseInput &mouse) const;
    bool send(const std::string &input);
};

#endif // INPUT_FORWARDER_H
