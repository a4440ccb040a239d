//
// Embedded terminal panel: tests with real child processes.
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
#include <errno.h>
#include <stdlib.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <functional>

#include <gtest/gtest.h>

#include "session.h"

// Host which remembers what it was asked to redraw
class RecordingHost : public HostSurface {
public:
    void refresh(const Region &region) override { regions.push_back(region); }
    void refresh() override { full_refreshes++; }

    std::vector<Region> regions;
    int full_refreshes{};
};

// Poll the session until the condition holds, or a few seconds pass.
static bool poll_until(Session &session, const std::function<bool()> &done)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        session.poll(20);
    }
    return true;
}

static bool poll_until_terminated(Session &session)
{
    return poll_until(session, [&session] { return session.get_state() == SessionState::TERMINATED; });
}

// Read from the child until it closes the terminal.
static std::string read_all_output(PtySession &pty)
{
    std::string output;
    char buffer[256];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t bytes = pty.read(buffer, sizeof(buffer));
        if (bytes > 0) {
            output.append(buffer, bytes);
        } else if (bytes == 0 || (errno != EAGAIN && errno != EINTR)) {
            break;
        } else {
            usleep(10000);
        }
    }
    return output;
}

static bool file_exists(const std::string &path)
{
    return access(path.c_str(), F_OK) == 0;
}

static std::string first_text(const StyledLine &line)
{
    return line.empty() ? std::string() : line[0].text;
}

TEST(SharedFileTest, CreateWriteRead)
{
    std::string path;
    {
        SharedFile file;
        EXPECT_FALSE(file.exists());
        ASSERT_TRUE(file.create(".py"));
        path = file.get_path();
        EXPECT_EQ(path.substr(path.size() - 3), ".py");
        EXPECT_TRUE(file_exists(path));

        std::string content;
        ASSERT_TRUE(file.read_all(content));
        EXPECT_EQ(content, "");

        ASSERT_TRUE(file.write_all("a\nb\n"));
        ASSERT_TRUE(file.write_all("x"));
        ASSERT_TRUE(file.read_all(content));
        EXPECT_EQ(content, "x");
    }
    EXPECT_FALSE(file_exists(path));
}

TEST(SharedFileTest, NamesAreUnique)
{
    SharedFile a, b;
    ASSERT_TRUE(a.create(".txt"));
    ASSERT_TRUE(b.create(".txt"));
    EXPECT_NE(a.get_path(), b.get_path());
}

TEST(PtySessionTest, MissingProgramThrows)
{
    PtySession pty;
    EXPECT_THROW(pty.spawn({ "/nonexistent/editor" }, { "TERM=linux" }, 80, 24), SpawnError);
    EXPECT_FALSE(pty.is_open());
    EXPECT_THROW(pty.spawn({}, {}, 80, 24), SpawnError);
}

TEST(PtySessionTest, WindowSizeApplied)
{
    PtySession pty;
    pty.spawn({ "/bin/sh", "-c", "stty size" }, { "PATH=/usr/bin:/bin" }, 100, 30);
    EXPECT_TRUE(pty.is_open());
    EXPECT_GT(pty.get_pid(), 0);

    std::string output = read_all_output(pty);
    EXPECT_NE(output.find("30 100"), std::string::npos) << output;
}

TEST(PtySessionTest, EnvironmentIsExact)
{
    PtySession pty;
    pty.spawn({ "/bin/sh", "-c", "echo \"[$TERM][$LC_ALL][$HOME]\"" },
              { "TERM=linux", "LC_ALL=en_GB.UTF-8" }, 80, 24);

    std::string output = read_all_output(pty);
    EXPECT_NE(output.find("[linux][en_GB.UTF-8][]"), std::string::npos) << output;
}

TEST(PtySessionTest, InputReachesChild)
{
    PtySession pty;
    pty.spawn({ "/bin/sh", "-c", "read line; echo \"got:$line\"" }, { "PATH=/usr/bin:/bin" }, 80,
              24);
    ASSERT_TRUE(pty.write("abc\n"));

    std::string output = read_all_output(pty);
    EXPECT_NE(output.find("got:abc"), std::string::npos) << output;

    pty.close();
    pty.reap();
    EXPECT_FALSE(pty.is_open());
    EXPECT_EQ(pty.get_pid(), -1);
    EXPECT_FALSE(pty.write("late"));
}

TEST(SessionTest, FinishedEditorLeavesFileContents)
{
    RecordingHost host;
    SessionOptions options;
    options.command     = "true";
    options.content     = "print(1)";
    options.has_content = true;
    options.language    = "py";

    Session session(options, host);
    EXPECT_EQ(session.get_suffix(), ".py");
    EXPECT_EQ(session.get_state(), SessionState::CREATED);

    // Nothing starts until the size is known.
    EXPECT_TRUE(session.poll(0));
    EXPECT_EQ(session.get_state(), SessionState::CREATED);

    session.on_resize(80, 24);
    ASSERT_TRUE(poll_until_terminated(session));
    EXPECT_FALSE(session.poll(0));

    auto line = session.render_line(0);
    ASSERT_EQ(line.size(), 1u);
    EXPECT_EQ(line[0].text, "print(1)");
    EXPECT_EQ(line[0].style, Style());
    EXPECT_TRUE(session.render_line(1).empty());
    EXPECT_GE(host.full_refreshes, 2);

    std::string text;
    ASSERT_TRUE(session.get_text(text));
    EXPECT_EQ(text, "print(1)");
}

TEST(SessionTest, DefaultSuffix)
{
    RecordingHost host;
    SessionOptions options;
    Session session(options, host);
    EXPECT_EQ(session.get_suffix(), ".txt");
    EXPECT_EQ(session.get_file_path().substr(session.get_file_path().size() - 4), ".txt");
}

TEST(SessionTest, EditedFileIsShown)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'printf \"first\\nsecond\\n\" > \"$0\"'";

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until_terminated(session));

    EXPECT_EQ(first_text(session.render_line(0)), "first");
    EXPECT_EQ(first_text(session.render_line(1)), "second");
    EXPECT_TRUE(session.render_line(2).empty());

    std::string text;
    ASSERT_TRUE(session.get_text(text));
    EXPECT_EQ(text, "first\nsecond\n");
}

TEST(SessionTest, CommandFromEnvironment)
{
    setenv("TERMPANEL_TEST_EDITOR", "sh -c 'echo from-env > \"$0\"'", 1);

    RecordingHost host;
    SessionOptions options;
    options.command    = "/nonexistent/editor";
    options.editor_env = "TERMPANEL_TEST_EDITOR";

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until_terminated(session));
    EXPECT_EQ(first_text(session.render_line(0)), "from-env");
}

TEST(SessionTest, SpawnFailureShowsEmptyPanel)
{
    RecordingHost host;
    SessionOptions options;
    options.command     = "/nonexistent/editor";
    options.content     = "keep me";
    options.has_content = true;

    Session session(options, host);
    session.on_resize(40, 10);
    EXPECT_FALSE(session.poll(0));
    EXPECT_EQ(session.get_state(), SessionState::TERMINATED);
    EXPECT_TRUE(session.render_line(0).empty());

    // The file is untouched.
    std::string text;
    ASSERT_TRUE(session.get_text(text));
    EXPECT_EQ(text, "keep me");
}

TEST(SessionTest, UnterminatedQuoteIsSpawnFailure)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "vim 'oops";

    Session session(options, host);
    session.on_resize(40, 10);
    EXPECT_FALSE(session.poll(0));
    EXPECT_EQ(session.get_state(), SessionState::TERMINATED);
}

TEST(SessionTest, LiveOutputRedrawsSingleRows)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'printf hello; exec sleep 1'";

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until(session, [&] {
        return first_text(session.render_line(0)).compare(0, 5, "hello") == 0;
    }));
    EXPECT_EQ(session.get_state(), SessionState::RUNNING);

    ASSERT_FALSE(host.regions.empty());
    for (const Region &region : host.regions) {
        EXPECT_EQ(region.height, 1);
        EXPECT_EQ(region.width, 40);
        EXPECT_GE(region.y, 0);
        EXPECT_LT(region.y, 10);
    }

    // The file was never written, so the final panel is empty.
    ASSERT_TRUE(poll_until_terminated(session));
    EXPECT_TRUE(session.render_line(0).empty());
}

TEST(SessionTest, ResizeBeforeSpawnIsDeferred)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'stty size > \"$0\"'";

    Session session(options, host);
    session.on_resize(40, 10);
    EXPECT_TRUE(session.resize_pending);
    EXPECT_EQ(session.get_state(), SessionState::CREATED);

    session.on_resize(50, 12);
    ASSERT_TRUE(poll_until_terminated(session));
    EXPECT_FALSE(session.resize_pending);

    std::string text;
    ASSERT_TRUE(session.get_text(text));
    EXPECT_EQ(text, "12 50\n");
}

TEST(SessionTest, ResizeDiscardsDirtyRowsAndCache)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'printf abc; exec sleep 5'";

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until(session, [&] {
        return first_text(session.render_line(0)).compare(0, 3, "abc") == 0;
    }));
    int refreshes = host.full_refreshes;

    session.on_resize(20, 5);
    EXPECT_EQ(host.full_refreshes, refreshes + 1);
    EXPECT_EQ(session.terminal->get_cols(), 20);
    EXPECT_EQ(session.terminal->get_rows(), 5);
    EXPECT_EQ(session.terminal->get_dirty_rows(), std::set<int>({ 0, 1, 2, 3, 4 }));

    // Old contents are gone from the new grid.
    auto line = session.render_line(0);
    ASSERT_FALSE(line.empty());
    EXPECT_NE(line[0].text.compare(0, 3, "abc"), 0);
    EXPECT_EQ(line.back().start_col + line.back().width, 20);

    // Rows beyond the new height no longer exist.
    EXPECT_TRUE(session.render_line(5).empty());
    EXPECT_TRUE(session.render_line(7).empty());
}

TEST(SessionTest, ChildEnvironment)
{
    setenv("TERMPANEL_TEST_SECRET", "leak", 1);

    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'echo \"$TERM|$LC_ALL|$COLUMNS|$LINES"
                      "|$TERMPANEL_TEST_SECRET|${PATH:+path}\" > \"$0\"'";

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until_terminated(session));
    EXPECT_EQ(first_text(session.render_line(0)), "linux|en_GB.UTF-8|40|10||path");
}

TEST(SessionTest, MouseOutsideGridNotForwarded)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'exec sleep 5'";

    Session session(options, host);
    session.on_resize(40, 10);
    session.poll(0);
    ASSERT_EQ(session.get_state(), SessionState::RUNNING);

    MouseInput left(MouseKind::MOVE, -1, 3);
    MouseInput above(MouseKind::DOWN, 3, -1);
    MouseInput right(MouseKind::UP, 40, 3);
    session.on_mouse(left);
    session.on_mouse(above);
    session.on_mouse(right);
    EXPECT_FALSE(left.consumed);
    EXPECT_FALSE(above.consumed);
    EXPECT_FALSE(right.consumed);
    EXPECT_EQ(session.forwarder.get_bytes_forwarded(), 0u);

    MouseInput inside(MouseKind::DOWN, 0, 0);
    session.on_mouse(inside);
    EXPECT_TRUE(inside.consumed);
    EXPECT_EQ(session.forwarder.get_bytes_forwarded(), std::string("\033[<0;1;1M").size());
}

TEST(SessionTest, InputForwardedWhileRunning)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'read line; echo \"$line\" > \"$0\"'";

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until(session, [&] { return session.get_state() == SessionState::RUNNING; }));

    KeyInput h('h', false, false);
    KeyInput i('i', false, false);
    KeyInput enter(KeyCode::ENTER);
    session.on_key(h);
    session.on_key(i);
    session.on_key(enter);
    EXPECT_TRUE(h.consumed);
    EXPECT_TRUE(enter.consumed);

    ASSERT_TRUE(poll_until_terminated(session));
    EXPECT_EQ(first_text(session.render_line(0)), "hi");
}

TEST(SessionTest, InputIgnoredAfterTermination)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "true";

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until_terminated(session));

    KeyInput key('x', false, false);
    session.on_key(key);
    EXPECT_TRUE(key.consumed);

    MouseInput mouse(MouseKind::DOWN, 3, 3);
    session.on_mouse(mouse);
    EXPECT_TRUE(mouse.consumed);

    EXPECT_EQ(session.forwarder.get_bytes_forwarded(), 0u);
}

TEST(SessionTest, FileAccessOnlyWhileNotRunning)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'exec sleep 5'";

    Session session(options, host);
    ASSERT_TRUE(session.set_text("draft"));
    std::string text;
    ASSERT_TRUE(session.get_text(text));
    EXPECT_EQ(text, "draft");

    session.on_resize(40, 10);
    session.poll(0);
    ASSERT_EQ(session.get_state(), SessionState::RUNNING);
    EXPECT_FALSE(session.set_text("other"));
    EXPECT_FALSE(session.get_text(text));
}

TEST(SessionTest, FrozenTextSurvivesResize)
{
    RecordingHost host;
    SessionOptions options;
    options.command     = "true";
    options.content     = "line one\nline two\n";
    options.has_content = true;

    Session session(options, host);
    session.on_resize(40, 10);
    ASSERT_TRUE(poll_until_terminated(session));

    session.on_resize(10, 3);
    EXPECT_EQ(first_text(session.render_line(0)), "line one");
    EXPECT_EQ(first_text(session.render_line(1)), "line two");
}

TEST(SessionTest, TeardownReapsChild)
{
    RecordingHost host;
    SessionOptions options;
    options.command = "sh -c 'exec sleep 30'";

    auto session = std::make_unique<Session>(options, host);
    session->on_resize(40, 10);
    session->poll(0);
    ASSERT_EQ(session->get_state(), SessionState::RUNNING);

    pid_t pid        = session->pty.get_pid();
    std::string path = session->get_file_path();
    ASSERT_GT(pid, 0);
    EXPECT_TRUE(file_exists(path));

    session.reset();

    // Reaped child no longer exists, not even as a zombie.
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    EXPECT_FALSE(file_exists(path));
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
