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
#ifndef UTF8_DECODER_H
#define UTF8_DECODER_H

#include <cstddef>
#include <string>

//
// Splits a byte stream into well-formed UTF-8 text.
// A sequence cut off at the end of a read is held back until the next
// read completes it; if the following bytes do not fit, its first byte
// is dropped.
// Ill-formed bytes inside a read are dropped right away.
//
class Utf8Decoder {
public:
    std::string decode(const char *data, size_t length);
    const std::string &get_pending() const { return pending; }

private:
    std::string pending;
};

// Append code point as UTF-8.
void append_utf8(std::string &out, char32_t ch);

// Convert UTF-32 string to UTF-8.
std::string to_utf8(const std::u32string &text);

#endif // UTF8_DECODER_H
