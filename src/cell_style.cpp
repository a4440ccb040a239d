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
#include "cell_style.h"

static const RgbColor base_colors[16] = {
    { 0, 0, 0 },       // Black
    { 205, 0, 0 },     // Red
    { 0, 205, 0 },     // Green
    { 135, 95, 0 },    // Brown, shown as orange4
    { 0, 0, 238 },     // Blue
    { 205, 0, 205 },   // Magenta
    { 0, 205, 205 },   // Cyan
    { 229, 229, 229 }, // White (Light Gray)
    { 127, 127, 127 }, // Bright Black (Gray)
    { 255, 0, 0 },     // Bright Red
    { 0, 255, 0 },     // Bright Green
    { 255, 255, 0 },   // Bright Yellow
    { 92, 92, 255 },   // Bright Blue
    { 255, 0, 255 },   // Bright Magenta
    { 0, 255, 255 },   // Bright Cyan
    { 255, 255, 255 }, // Bright White
};

RgbColor palette_color(uint8_t index)
{
    if (index < 16) {
        return base_colors[index];
    }
    if (index < 232) {
        // 6x6x6 color cube
        static const uint8_t level[6] = { 0, 95, 135, 175, 215, 255 };
        int n = index - 16;
        return { level[n / 36], level[(n % 36) / 6], level[n % 6] };
    }

    // Grayscale ramp
    auto shade = static_cast<uint8_t>(8 + (index - 232) * 10);
    return { shade, shade, shade };
}

bool map_color(const CellColor &color, RgbColor &rgb)
{
    switch (color.kind) {
    case CellColor::Kind::DEFAULT:
        return false;
    case CellColor::Kind::INDEXED:
        rgb = palette_color(color.index);
        return true;
    case CellColor::Kind::RGB:
        rgb = color.rgb;
        return true;
    }
    return false;
}

Style map_style(const ScreenCell &cell, bool at_cursor)
{
    Style style;
    style.has_fg    = map_color(cell.fg, style.fg);
    style.has_bg    = map_color(cell.bg, style.bg);
    style.bold      = cell.bold;
    style.italic    = cell.italic;
    style.underline = cell.underline;
    style.blink     = cell.blink;
    style.strike    = cell.strikethrough;
    style.reverse   = cell.reverse;

    // Only the cursor cell shows the caret.
    if (at_cursor) {
        style.reverse = !style.reverse;
    }
    return style;
}
