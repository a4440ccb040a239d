//
// Decoding engine based on libvterm.
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
#include "vterm_engine.h"

#include <stdexcept>

static CellColor convert_color(const VTermColor &color)
{
    if (VTERM_COLOR_IS_DEFAULT_FG(&color) || VTERM_COLOR_IS_DEFAULT_BG(&color)) {
        return CellColor();
    }
    if (VTERM_COLOR_IS_INDEXED(&color)) {
        return CellColor::indexed(color.indexed.idx);
    }
    return CellColor::from_rgb(color.rgb.red, color.rgb.green, color.rgb.blue);
}

VTermEngine::VTermEngine(int cols, int rows) : term_cols(cols), term_rows(rows)
{
    vt = vterm_new(term_rows, term_cols);
    if (!vt) {
        throw std::runtime_error("Cannot create libvterm instance");
    }
    vterm_set_utf8(vt, 1);

    screen               = vterm_obtain_screen(vt);
    callbacks.damage     = on_damage;
    callbacks.movecursor = on_movecursor;
    vterm_screen_set_callbacks(screen, &callbacks, this);

    // Without a moverect callback, scrolls are reported as damage.
    vterm_screen_set_damage_merge(screen, VTERM_DAMAGE_SCROLL);
    vterm_screen_enable_altscreen(screen, 1);
    vterm_screen_reset(screen, 1);
}

VTermEngine::~VTermEngine()
{
    vterm_free(vt);
}

void VTermEngine::feed(const std::string &text)
{
    vterm_input_write(vt, text.data(), text.size());
    vterm_screen_flush_damage(screen);
}

ScreenCell VTermEngine::cell(int row, int col) const
{
    ScreenCell cell;
    VTermPos pos;
    pos.row = row;
    pos.col = col;

    VTermScreenCell vc;
    if (!vterm_screen_get_cell(screen, pos, &vc)) {
        return cell;
    }

    cell.fg            = convert_color(vc.fg);
    cell.bg            = convert_color(vc.bg);
    cell.bold          = vc.attrs.bold;
    cell.italic        = vc.attrs.italic;
    cell.underline     = vc.attrs.underline != 0;
    cell.blink         = vc.attrs.blink;
    cell.strikethrough = vc.attrs.strike;
    cell.reverse       = vc.attrs.reverse;

    if (vc.chars[0] == static_cast<uint32_t>(-1)) {
        // Right half of a wide glyph.
        cell.text.clear();
        cell.width = 0;
        return cell;
    }

    cell.text.clear();
    for (int i = 0; i < VTERM_MAX_CHARS_PER_CELL && vc.chars[i] != 0; ++i) {
        cell.text += static_cast<char32_t>(vc.chars[i]);
    }
    if (cell.text.empty()) {
        cell.text = U" ";
    }
    cell.width = vc.width;
    return cell;
}

int VTermEngine::on_damage(VTermRect rect, void *user)
{
    auto *engine = static_cast<VTermEngine *>(user);
    for (int row = rect.start_row; row < rect.end_row; ++row) {
        engine->dirty.insert(row);
    }
    return 1;
}

int VTermEngine::on_movecursor(VTermPos pos, VTermPos oldpos, int visible, void *user)
{
    auto *engine           = static_cast<VTermEngine *>(user);
    engine->cursor_pos.row = pos.row;
    engine->cursor_pos.col = pos.col;
    return 1;
}

std::unique_ptr<DecodeEngine> make_vterm_engine(int cols, int rows)
{
    return std::make_unique<VTermEngine>(cols, rows);
}
