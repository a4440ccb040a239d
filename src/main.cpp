//
// Embedded terminal panel: demo application.
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
#include <iostream>
#include <string>

#include "sdl_host.h"

//
// Usage: termpanel [command [content [language]]]
// A command of the form $NAME is taken from environment variable NAME.
// The final text of the file is printed on exit.
//
int main(int argc, char *argv[])
{
    SessionOptions options;
    options.content     = "print(\"Hello, World!\")";
    options.has_content = true;
    options.language    = "py";

    if (argc > 1) {
        std::string command = argv[1];
        if (command.size() > 1 && command[0] == '$') {
            options.editor_env = command.substr(1);
        } else {
            options.command = command;
        }
    }
    if (argc > 2) {
        options.content = argv[2];
    }
    if (argc > 3) {
        options.language = argv[3];
    }

    try {
        std::string text;
        {
            SdlHost host(options);
            if (!host.initialize())
                return 1;
            host.run();

            if (!host.get_session()->get_text(text)) {
                std::cerr << "Editor did not finish, file contents are not available" << std::endl;
                return 1;
            }
        }
        std::cout << text;
    } catch (const std::exception &e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
