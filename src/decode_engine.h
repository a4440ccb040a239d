//
// Interface to the escape sequence decoding engine.
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
#ifndef DECODE_ENGINE_H
#define DECODE_ENGINE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>

// RGB color triple
struct RgbColor {
    uint8_t r = 0, g = 0, b = 0;

    bool operator==(const RgbColor &other) const
    {
        return r == other.r && g == other.g && b == other.b;
    }
};

// Color of a cell as reported by the engine
struct CellColor {
    enum class Kind { DEFAULT, INDEXED, RGB };

    Kind kind{ Kind::DEFAULT };
    uint8_t index{}; // Palette index for INDEXED
    RgbColor rgb;    // Value for RGB

    static CellColor indexed(uint8_t index)
    {
        CellColor color;
        color.kind  = Kind::INDEXED;
        color.index = index;
        return color;
    }

    static CellColor from_rgb(uint8_t r, uint8_t g, uint8_t b)
    {
        CellColor color;
        color.kind = Kind::RGB;
        color.rgb  = { r, g, b };
        return color;
    }
};

// Attributes of a single grid cell
struct ScreenCell {
    std::u32string text{ U" " }; // Base character followed by combining marks
    CellColor fg;
    CellColor bg;
    bool bold{};
    bool italic{};
    bool underline{};
    bool blink{};
    bool strikethrough{};
    bool reverse{};
    int width{ 1 }; // 2 for a double-width glyph, 0 for the column it covers
};

// Cursor position
struct Cursor {
    int row = 0;
    int col = 0;

    bool operator==(const Cursor &other) const { return row == other.row && col == other.col; }
    bool operator!=(const Cursor &other) const { return !(*this == other); }
};

//
// Terminal emulation engine: interprets a stream of text with embedded
// control sequences and maintains a grid of cells.
//
class DecodeEngine {
public:
    virtual ~DecodeEngine() = default;

    // Interpret UTF-8 text.
    virtual void feed(const std::string &text) = 0;

    virtual int cols() const = 0;
    virtual int rows() const = 0;
    virtual ScreenCell cell(int row, int col) const = 0;
    virtual Cursor cursor() const = 0;

    // Rows changed since the last clear_dirty().
    virtual const std::set<int> &dirty_rows() const = 0;
    virtual void clear_dirty() = 0;
};

// Creates an engine for a grid of the given size.
using EngineFactory = std::function<std::unique_ptr<DecodeEngine>(int cols, int rows)>;

#endif // DECODE_ENGINE_H
