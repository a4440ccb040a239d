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
#include "input_forwarder.h"

#include <unicode/uchar.h>

#include <cctype>
#include <map>

#include "pty_session.h"
#include "terminal_state.h"
#include "utf8_decoder.h"

InputForwarder::InputForwarder(PtySession &pty, const std::unique_ptr<TerminalState> &terminal)
    : pty(pty), terminal(terminal)
{
}

bool InputForwarder::session_ended() const
{
    return terminal && terminal->is_frozen();
}

bool InputForwarder::inside_grid(const MouseInput &mouse) const
{
    if (!terminal)
        return false;
    return mouse.x >= 0 && mouse.y >= 0 && mouse.x < terminal->get_cols() &&
           mouse.y < terminal->get_rows();
}

bool InputForwarder::send(const std::string &input)
{
    if (!pty.write(input))
        return false;
    bytes_forwarded += input.size();
    return true;
}

void InputForwarder::forward_key(KeyInput &key)
{
    if (session_ended()) {
        // Nobody is listening anymore.
        key.consumed = true;
        return;
    }

    std::string input = encode_key(key);
    if (input.empty())
        return;
    if (send(input))
        key.consumed = true;
}

void InputForwarder::forward_mouse(MouseInput &mouse)
{
    if (session_ended()) {
        mouse.consumed = true;
        return;
    }
    if (!inside_grid(mouse))
        return;
    if (send(encode_mouse(mouse)))
        mouse.consumed = true;
}

std::string InputForwarder::encode_key(const KeyInput &key)
{
    std::string input;

    // Map keycodes to terminal inputs
    switch (key.code) {
    case KeyCode::UNKNOWN:
        // No input.
        break;
    case KeyCode::ENTER:
        input = "\r";
        break;
    case KeyCode::BACKSPACE:
        input = "\177";
        break;
    case KeyCode::TAB:
        input = "\t";
        break;
    case KeyCode::ESCAPE:
        input = "\033";
        break;
    case KeyCode::UP:
        input = key.mod_ctrl ? "\033[1;5A" : "\033[A";
        break;
    case KeyCode::DOWN:
        input = key.mod_ctrl ? "\033[1;5B" : "\033[B";
        break;
    case KeyCode::RIGHT:
        input = key.mod_ctrl ? "\033[1;5C" : "\033[C";
        break;
    case KeyCode::LEFT:
        input = key.mod_ctrl ? "\033[1;5D" : "\033[D";
        break;
    case KeyCode::HOME:
        input = "\033[H";
        break;
    case KeyCode::END:
        input = "\033[4~";
        break;
    case KeyCode::INSERT:
        input = "\033[2~";
        break;
    case KeyCode::DELETE:
        input = "\033[3~";
        break;
    case KeyCode::PAGEUP:
        input = "\033[5~";
        break;
    case KeyCode::PAGEDOWN:
        input = "\033[6~";
        break;
    case KeyCode::F1:
        input = "\033OP";
        break;
    case KeyCode::F2:
        input = "\033OQ";
        break;
    case KeyCode::F3:
        input = "\033OR";
        break;
    case KeyCode::F4:
        input = "\033OS";
        break;
    case KeyCode::F5:
        input = "\033[15~";
        break;
    case KeyCode::F6:
        input = "\033[17~";
        break;
    case KeyCode::F7:
        input = "\033[18~";
        break;
    case KeyCode::F8:
        input = "\033[19~";
        break;
    case KeyCode::F9:
        input = "\033[20~";
        break;
    case KeyCode::F10:
        input = "\033[21~";
        break;
    case KeyCode::F11:
        input = "\033[23~";
        break;
    case KeyCode::F12:
        input = "\033[24~";
        break;
    case KeyCode::CHARACTER:
        if (key.character == 0) {
            // Nothing to send.
        } else if (key.mod_ctrl && key.character <= 0x7f) {
            //
            // Ctrl modifier is pressed.
            //
            input = std::string(1, key.character & 0x1f);
        } else if (key.mod_shift) {
            //
            // Shift modifier is pressed.
            //
            if (key.character <= 0x7f) {
                // ASCII symbol.
                char ch = key.character;
                if (key.character >= 'a' && key.character <= 'z') {
                    ch = std::toupper(ch);
                } else {
                    static const std::map<char, char> shift_map = {
                        { '1', '!' },  { '2', '@' }, { '3', '#' }, { '4', '$' }, { '5', '%' },
                        { '6', '^' },  { '7', '&' }, { '8', '*' }, { '9', '(' }, { '0', ')' },
                        { '-', '_' },  { '=', '+' }, { '[', '{' }, { ']', '}' }, { ';', ':' },
                        { '\'', '"' }, { ',', '<' }, { '.', '>' }, { '/', '?' }, { '`', '~' },
                        { '\\', '|' }
                    };
                    auto it = shift_map.find(ch);
                    if (it != shift_map.end()) {
                        ch = it->second;
                    }
                }
                input = std::string(1, ch);
            } else {
                // Convert Unicode character to uppercase.
                append_utf8(input, u_toupper(key.character));
            }
        } else {
            append_utf8(input, key.character);
        }
        break;
    }
    return input;
}

std::string InputForwarder::encode_mouse(const MouseInput &mouse)
{
    // Terminal coordinates are 1-based.
    std::string position = std::to_string(mouse.x + 1) + ";" + std::to_string(mouse.y + 1);

    switch (mouse.kind) {
    case MouseKind::MOVE:
        return "\033[<35;" + position + "M";
    case MouseKind::DOWN:
        return "\033[<0;" + position + "M";
    case MouseKind::UP:
        return "\033[<0;" + position + "m";
    }
    return std::string();
}
