//
// Embedded terminal program session.
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
#include "session.h"

#include <stdlib.h>

#include <algorithm>
#include <iostream>
#include <utility>

#include "command_line.h"
#include "vterm_engine.h"

Session::Session(const SessionOptions &options, HostSurface &host, EngineFactory engine_factory)
    : options(options), host(host), engine_factory(std::move(engine_factory)),
      suffix(options.language.empty() ? ".txt" : "." + options.language),
      io_loop(pty, shared_file, terminal, host, options.read_chunk_size),
      forwarder(pty, terminal)
{
    if (!shared_file.create(suffix))
        return;
    if (options.has_content && !shared_file.write_all(options.content)) {
        std::cerr << "Cannot store initial contents of the file" << std::endl;
    }
}

Session::~Session()
{
    io_loop.cancel();
}

std::unique_ptr<DecodeEngine> Session::make_default_engine(int cols, int rows)
{
    return make_vterm_engine(cols, rows);
}

void Session::advance(SessionState next)
{
    // No way back.
    if (next > state)
        state = next;
}

void Session::on_resize(int cols, int rows)
{
    term_cols = std::max(cols, 1);
    term_rows = std::max(rows, 1);

    // New geometry starts from scratch; a finished session keeps its final text.
    std::vector<std::string> final_content;
    bool was_frozen = terminal && terminal->is_frozen();
    if (was_frozen) {
        final_content = terminal->get_frozen_content();
    }
    terminal = std::make_unique<TerminalState>(engine_factory(term_cols, term_rows));
    if (was_frozen) {
        terminal->freeze(final_content);
    }

    switch (state) {
    case SessionState::CREATED:
        resize_pending = true;
        break;
    case SessionState::SPAWNED:
    case SessionState::RUNNING:
        // Failure means the child is going away.
        pty.resize(term_cols, term_rows);
        break;
    case SessionState::TERMINATED:
        break;
    }
    host.refresh();
}

void Session::on_key(KeyInput &key)
{
    forwarder.forward_key(key);
}

void Session::on_mouse(MouseInput &mouse)
{
    forwarder.forward_mouse(mouse);
}

StyledLine Session::render_line(int y)
{
    if (!terminal)
        return StyledLine();
    return terminal->get_line(y);
}

bool Session::get_text(std::string &text) const
{
    if (state == SessionState::SPAWNED || state == SessionState::RUNNING)
        return false;
    if (!shared_file.exists())
        return false;
    return shared_file.read_all(text);
}

bool Session::set_text(const std::string &text)
{
    if (state == SessionState::SPAWNED || state == SessionState::RUNNING)
        return false;
    if (!shared_file.exists())
        return false;
    return shared_file.write_all(text);
}

bool Session::build_argv(std::vector<std::string> &argv) const
{
    std::string command = options.command;
    if (!options.editor_env.empty()) {
        const char *value = getenv(options.editor_env.c_str());
        command           = value ? value : "";
    }
    if (!split_command(command, argv))
        return false;
    argv.push_back(shared_file.get_path());
    return true;
}

std::vector<std::string> Session::build_env() const
{
    std::vector<std::string> env = {
        "TERM=" + options.term_type,
        "LC_ALL=" + options.locale,
        "COLUMNS=" + std::to_string(term_cols),
        "LINES=" + std::to_string(term_rows),
    };

    // Needed to locate the program and its configuration.
    for (const char *name : { "PATH", "HOME" }) {
        const char *value = getenv(name);
        if (value) {
            env.push_back(std::string(name) + "=" + value);
        }
    }
    return env;
}

void Session::start()
{
    try {
        if (!shared_file.exists()) {
            throw SpawnError("No file to edit");
        }
        std::vector<std::string> argv;
        if (!build_argv(argv)) {
            throw SpawnError("Unterminated quote in command: " + options.command);
        }
        pty.spawn(argv, build_env(), term_cols, term_rows);
    } catch (const SpawnError &e) {
        std::cerr << "Cannot start editor: " << e.what() << std::endl;
        terminal->freeze(std::vector<std::string>());
        advance(SessionState::TERMINATED);
        host.refresh();
        return;
    }
    advance(SessionState::SPAWNED);

    if (resize_pending) {
        pty.resize(term_cols, term_rows);
        resize_pending = false;
    }
    advance(SessionState::RUNNING);
}

bool Session::poll(int timeout_ms)
{
    if (state == SessionState::CREATED) {
        // Wait for the host to report its size.
        if (!terminal)
            return true;
        start();
    }

    if (state == SessionState::RUNNING && !io_loop.poll(timeout_ms)) {
        advance(SessionState::TERMINATED);
    }
    return state != SessionState::TERMINATED;
}
