//
// Parsing of editor command lines.
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
#include "command_line.h"

#include <cstring>

bool split_command(const std::string &command, std::vector<std::string> &words)
{
    enum class Quote { NONE, SINGLE, DOUBLE };

    words.clear();
    std::string word;
    bool in_word = false;
    Quote quote  = Quote::NONE;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        switch (quote) {
        case Quote::SINGLE:
            if (c == '\'')
                quote = Quote::NONE;
            else
                word += c;
            break;

        case Quote::DOUBLE:
            if (c == '"') {
                quote = Quote::NONE;
            } else if (c == '\\' && i + 1 < command.size() && command[i + 1] != '\0' &&
                       std::strchr("\\\"$`", command[i + 1])) {
                word += command[++i];
            } else {
                word += c;
            }
            break;

        case Quote::NONE:
            if (c == ' ' || c == '\t' || c == '\n') {
                if (in_word) {
                    words.push_back(word);
                    word.clear();
                    in_word = false;
                }
            } else if (c == '\'') {
                quote   = Quote::SINGLE;
                in_word = true;
            } else if (c == '"') {
                quote   = Quote::DOUBLE;
                in_word = true;
            } else if (c == '\\' && i + 1 < command.size()) {
                word += command[++i];
                in_word = true;
            } else {
                word += c;
                in_word = true;
            }
            break;
        }
    }
    if (quote != Quote::NONE)
        return false;
    if (in_word)
        words.push_back(word);
    return true;
}
