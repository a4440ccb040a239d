//
// Temporary file shared with the embedded program.
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
#ifndef SHARED_FILE_H
#define SHARED_FILE_H

#include <string>
#include <vector>

//
// Uniquely named temporary file, passed to the child program by path.
// The file is removed when this object is destroyed.
//
class SharedFile {
public:
    SharedFile() = default;
    ~SharedFile();
    SharedFile(const SharedFile &) = delete;
    SharedFile &operator=(const SharedFile &) = delete;

    // Create empty file with given suffix, like ".py".
    bool create(const std::string &suffix);

    // Read whole file.
    bool read_all(std::string &content) const;

    // Replace contents of the file.
    bool write_all(const std::string &content);

    const std::string &get_path() const { return path; }
    bool exists() const { return !path.empty(); }

private:
    std::string path;
};

// Split text into lines. Line terminators are removed;
// a terminator at the very end does not start a new line.
std::vector<std::string> split_lines(const std::string &text);

#endif // SHARED_FILE_H
