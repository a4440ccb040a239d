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
#include "terminal_state.h"

#include <algorithm>
#include <utility>

#include "char_width.h"
#include "utf8_decoder.h"

TerminalState::TerminalState(std::unique_ptr<DecodeEngine> engine) : engine(std::move(engine))
{
    for (int row = 0; row < get_rows(); ++row) {
        dirty_rows.insert(row);
    }
}

void TerminalState::mark_dirty(int row)
{
    if (row < 0 || row >= get_rows())
        return;
    dirty_rows.insert(row);
    cache.invalidate(row);
}

void TerminalState::feed(const std::string &text)
{
    if (frozen)
        return;

    engine->feed(text);

    // Redraw lines where cursor moved from/to.
    Cursor cursor = engine->cursor();
    if (!cursor_known || cursor != last_cursor) {
        mark_dirty(cursor.row);
        if (cursor_known) {
            mark_dirty(last_cursor.row);
        }
        last_cursor  = cursor;
        cursor_known = true;
    }

    for (int row : engine->dirty_rows()) {
        mark_dirty(row);
    }
    engine->clear_dirty();
}

StyledLine TerminalState::get_line(int y)
{
    if (frozen) {
        if (y < 0 || y >= static_cast<int>(frozen_content.size()))
            return StyledLine();

        const std::string &text = frozen_content[y];
        if (text.empty())
            return StyledLine();

        StyledSegment segment;
        segment.text  = text;
        segment.width = display_width(text);
        return StyledLine{ segment };
    }

    if (y < 0 || y >= get_rows())
        return StyledLine();

    if (dirty_rows.count(y)) {
        cache.put(y, render_row(y));
        dirty_rows.erase(y);
    }
    return cache.get(y);
}

StyledLine TerminalState::render_row(int y) const
{
    StyledLine line;
    Cursor cursor = engine->cursor();
    int cols      = get_cols();
    bool is_wide  = false;

    for (int x = 0; x < cols; ++x) {
        if (is_wide) {
            // Column covered by the previous glyph.
            is_wide = false;
            continue;
        }

        ScreenCell cell = engine->cell(y, x);
        if (cell.width == 0)
            continue;

        char32_t lead = cell.text.empty() ? U' ' : cell.text[0];
        is_wide       = cell.width == 2 || char_width(lead) == 2;
        int width     = std::min(is_wide ? 2 : 1, cols - x);

        Style style      = map_style(cell, x == cursor.col && y == cursor.row);
        std::string text = cell.text.empty() ? std::string(" ") : to_utf8(cell.text);

        if (!line.empty() && line.back().style == style &&
            line.back().start_col + line.back().width == x) {
            line.back().text += text;
            line.back().width += width;
        } else {
            StyledSegment segment;
            segment.text      = std::move(text);
            segment.style     = style;
            segment.start_col = x;
            segment.width     = width;
            line.push_back(std::move(segment));
        }
    }
    return line;
}

void TerminalState::freeze(const std::vector<std::string> &content)
{
    if (frozen)
        return;
    frozen         = true;
    frozen_content = content;
    dirty_rows.clear();
    cache.clear();
}
