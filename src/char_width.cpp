//
// Display width of characters.
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
#include "char_width.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <unordered_map>

static const size_t width_cache_limit = 4096;

static int compute_width(char32_t ch)
{
    if (ch == 0)
        return 0;
    if (ch < 0x20 || (ch >= 0x7f && ch < 0xa0))
        return -1;

    auto c = static_cast<UChar32>(ch);
    switch (u_charType(c)) {
    case U_NON_SPACING_MARK:
    case U_ENCLOSING_MARK:
    case U_FORMAT_CHAR:
        return 0;
    default:
        break;
    }
    if (u_hasBinaryProperty(c, UCHAR_DEFAULT_IGNORABLE_CODE_POINT))
        return 0;

    // Hangul medial vowels and final consonants join the preceding syllable.
    if (ch >= 0x1160 && ch <= 0x11ff)
        return 0;

    switch (u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH)) {
    case U_EA_WIDE:
    case U_EA_FULLWIDTH:
        return 2;
    default:
        return 1;
    }
}

int char_width(char32_t ch)
{
    // Only called from the UI thread.
    static std::unordered_map<char32_t, int> cache;

    auto it = cache.find(ch);
    if (it != cache.end())
        return it->second;

    if (cache.size() >= width_cache_limit)
        cache.clear();
    int width = compute_width(ch);
    cache.emplace(ch, width);
    return width;
}

int display_width(const std::string &utf8)
{
    const auto *s = reinterpret_cast<const uint8_t *>(utf8.data());
    auto length   = static_cast<int32_t>(utf8.size());
    int width     = 0;

    for (int32_t i = 0; i < length;) {
        UChar32 ch;
        U8_NEXT(s, i, length, ch);
        if (ch < 0)
            continue;
        int w = char_width(static_cast<char32_t>(ch));
        if (w > 0)
            width += w;
    }
    return width;
}
