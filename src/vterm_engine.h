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
#ifndef VTERM_ENGINE_H
#define VTERM_ENGINE_H

#include <vterm.h>

#include "decode_engine.h"

class VTermEngine : public DecodeEngine {
public:
    VTermEngine(int cols, int rows);
    ~VTermEngine() override;
    VTermEngine(const VTermEngine &) = delete;
    VTermEngine &operator=(const VTermEngine &) = delete;

    void feed(const std::string &text) override;
    int cols() const override { return term_cols; }
    int rows() const override { return term_rows; }
    ScreenCell cell(int row, int col) const override;
    Cursor cursor() const override { return cursor_pos; }
    const std::set<int> &dirty_rows() const override { return dirty; }
    void clear_dirty() override { dirty.clear(); }

private:
    int term_cols;
    int term_rows;
    VTerm *vt{};
    VTermScreen *screen{};
    VTermScreenCallbacks callbacks{};
    Cursor cursor_pos;
    std::set<int> dirty;

    // libvterm callbacks
    static int on_damage(VTermRect rect, void *user);
    static int on_movecursor(VTermPos pos, VTermPos oldpos, int visible, void *user);
};

// Factory for Session.
std::unique_ptr<DecodeEngine> make_vterm_engine(int cols, int rows);

#endif // VTERM_ENGINE_H
