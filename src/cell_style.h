//
// Translation of terminal cell attributes into display styles.
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
#ifndef CELL_STYLE_H
#define CELL_STYLE_H

#include <string>
#include <vector>

#include "decode_engine.h"

// Display style of a run of characters
struct Style {
    RgbColor fg;
    RgbColor bg;
    bool has_fg{}; // False means the host's default foreground
    bool has_bg{}; // False means the host's default background
    bool bold{};
    bool italic{};
    bool underline{};
    bool blink{};
    bool strike{};
    bool reverse{};

    bool operator==(const Style &other) const
    {
        return has_fg == other.has_fg && (!has_fg || fg == other.fg) &&
               has_bg == other.has_bg && (!has_bg || bg == other.bg) && bold == other.bold &&
               italic == other.italic && underline == other.underline && blink == other.blink &&
               strike == other.strike && reverse == other.reverse;
    }
    bool operator!=(const Style &other) const { return !(*this == other); }
};

// Structure for a span of characters with the same style
struct StyledSegment {
    std::string text; // UTF-8
    Style style;
    int start_col{};
    int width{}; // Number of columns covered
};

using StyledLine = std::vector<StyledSegment>;

// Color of xterm-256 palette entry.
RgbColor palette_color(uint8_t index);

// Returns false for the default color.
bool map_color(const CellColor &color, RgbColor &rgb);

// Style of a cell; reverse video is flipped at the cursor position.
Style map_style(const ScreenCell &cell, bool at_cursor);

#endif // CELL_STYLE_H
