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
#include "shared_file.h"

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <iostream>

SharedFile::~SharedFile()
{
    if (!path.empty()) {
        unlink(path.c_str());
    }
}

bool SharedFile::create(const std::string &suffix)
{
    const char *tmpdir = getenv("TMPDIR");
    std::string name   = (tmpdir && *tmpdir) ? tmpdir : "/tmp";
    name += "/termpanel-XXXXXX";
    name += suffix;

    int fd = mkstemps(&name[0], static_cast<int>(suffix.size()));
    if (fd == -1) {
        std::cerr << "Error creating temporary file: " << strerror(errno) << std::endl;
        return false;
    }
    close(fd);
    path = name;
    return true;
}

bool SharedFile::read_all(std::string &content) const
{
    // Open by path: the editor may have replaced the file while saving.
    int fd = open(path.c_str(), O_RDONLY);
    if (fd == -1) {
        std::cerr << "Error opening " << path << ": " << strerror(errno) << std::endl;
        return false;
    }

    content.clear();
    char buffer[4096];
    for (;;) {
        ssize_t bytes = read(fd, buffer, sizeof(buffer));
        if (bytes < 0) {
            if (errno == EINTR)
                continue;
            std::cerr << "Error reading " << path << ": " << strerror(errno) << std::endl;
            close(fd);
            return false;
        }
        if (bytes == 0)
            break;
        content.append(buffer, bytes);
    }
    close(fd);
    return true;
}

bool SharedFile::write_all(const std::string &content)
{
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd == -1) {
        std::cerr << "Error opening " << path << ": " << strerror(errno) << std::endl;
        return false;
    }

    size_t done = 0;
    while (done < content.size()) {
        ssize_t bytes = write(fd, content.data() + done, content.size() - done);
        if (bytes < 0) {
            if (errno == EINTR)
                continue;
            std::cerr << "Error writing " << path << ": " << strerror(errno) << std::endl;
            close(fd);
            return false;
        }
        done += bytes;
    }
    if (fsync(fd) == -1) {
        std::cerr << "Error flushing " << path << ": " << strerror(errno) << std::endl;
    }
    if (close(fd) == -1) {
        std::cerr << "Error closing " << path << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

//
// Length of the line terminator at position i, or 0.
// Besides CR, LF and CRLF, these are VT, FF, FS, GS, RS,
// and U+0085, U+2028, U+2029 in UTF-8.
//
static size_t terminator_length(const std::string &text, size_t i)
{
    switch (text[i]) {
    case '\r':
        return text.compare(i, 2, "\r\n") == 0 ? 2 : 1;
    case '\n':
    case '\v':
    case '\f':
    case '\x1c':
    case '\x1d':
    case '\x1e':
        return 1;
    case '\xc2':
        return text.compare(i, 2, "\xc2\x85") == 0 ? 2 : 0;
    case '\xe2':
        if (text.compare(i, 3, "\xe2\x80\xa8") == 0 || text.compare(i, 3, "\xe2\x80\xa9") == 0)
            return 3;
        return 0;
    default:
        return 0;
    }
}

std::vector<std::string> split_lines(const std::string &text)
{
    std::vector<std::string> lines;
    std::string line;
    for (size_t i = 0; i < text.size();) {
        size_t length = terminator_length(text, i);
        if (length > 0) {
            lines.push_back(line);
            line.clear();
            i += length;
        } else {
            line += text[i++];
        }
    }
    if (!line.empty()) {
        lines.push_back(line);
    }
    return lines;
}
