//
// Incremental UTF-8 decoding of terminal output.
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
#include "utf8_decoder.h"

#include <unicode/utf8.h>

//
// Check whether bytes from start to the end of input are a valid
// but incomplete multi-byte sequence.
//
static bool is_truncated(const uint8_t *s, int32_t start, int32_t length)
{
    uint8_t lead = s[start];
    if (!U8_IS_LEAD(lead))
        return false;
    if (start + U8_COUNT_TRAIL_BYTES(lead) < length)
        return false;
    for (int32_t i = start + 1; i < length; ++i) {
        if (!U8_IS_TRAIL(s[i]))
            return false;
    }
    return true;
}

std::string Utf8Decoder::decode(const char *data, size_t length)
{
    std::string input;
    input.swap(pending);
    input.append(data, length);

    const auto *s = reinterpret_cast<const uint8_t *>(input.data());
    auto size     = static_cast<int32_t>(input.size());
    std::string text;
    text.reserve(input.size());

    int32_t i = 0;
    while (i < size) {
        int32_t start = i;
        UChar32 ch;
        U8_NEXT(s, i, size, ch);
        if (ch >= 0) {
            text.append(input, start, i - start);
            continue;
        }

        if (is_truncated(s, start, size)) {
            // Rest of the sequence is still on its way.
            pending.assign(input, start, std::string::npos);
            return text;
        }

        // No later input can complete it: discard one byte and go on.
        i = start + 1;
    }
    return text;
}

void append_utf8(std::string &out, char32_t ch)
{
    uint8_t buf[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buf, length, static_cast<UChar32>(ch));
    out.append(reinterpret_cast<const char *>(buf), length);
}

std::string to_utf8(const std::u32string &text)
{
    std::string utf8;
    for (char32_t ch : text) {
        append_utf8(utf8, ch);
    }
    return utf8;
}
