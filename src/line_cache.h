//
// Cache of rendered terminal lines.
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
#ifndef LINE_CACHE_H
#define LINE_CACHE_H

#include <map>

#include "cell_style.h"

//
// Styled content of rows, keyed by row index.
// Entries are dropped when their row changes and rebuilt on demand.
//
class LineCache {
public:
    bool contains(int row) const { return lines.count(row) != 0; }

    // Cached line, or an empty line when nothing is cached.
    const StyledLine &get(int row) const;

    void put(int row, StyledLine line);
    void invalidate(int row);
    void clear();
    size_t size() const { return lines.size(); }

private:
    std::map<int, StyledLine> lines;
};

#endif // LINE_CACHE_H
