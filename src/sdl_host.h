//
// Embedded terminal panel: SDL window hosting a session.
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
#ifndef SDL_HOST_H
#define SDL_HOST_H

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <memory>
#include <string>
#include <vector>

#include "cell_style.h"
#include "host_surface.h"
#include "session.h"

// Rendered segment of a row
struct TextSpan {
    StyledSegment segment;
    SDL_Texture *texture{};
};

class SdlHost : public HostSurface {
public:
    // Empty font path selects the platform's monospace font.
    SdlHost(const SessionOptions &options, int cols = 80, int rows = 24,
            const std::string &font_path = "", int font_size = 16);
    ~SdlHost();
    bool initialize();
    void run();

    // HostSurface interface
    void refresh(const Region &region) override;
    void refresh() override;

    Session *get_session() { return session.get(); }

private:
    SessionOptions options;
    std::unique_ptr<Session> session;

    // Panel geometry
    int term_cols;
    int term_rows;
    std::vector<std::vector<TextSpan>> texture_cache;
    std::vector<bool> dirty_lines;
    int font_size;       // Current font size in points
    std::string font_path;

    // SDL resources
    SDL_Window *window{};
    SDL_Renderer *renderer{};
    TTF_Font *font{};
    int char_width{};
    int char_height{};
    bool running{};

    // Initialization methods
    bool initialize_sdl();
    bool open_font(int size);

    // Rendering methods
    void render_text();
    void update_texture_cache();
    void render_spans();
    void clear_row(int row);
    void resize_panel(int cols, int rows);

    // Input handling methods
    void handle_events();
    void handle_key_event(const SDL_KeyboardEvent &key);
    void handle_mouse_event(MouseKind kind, int x, int y);
    void change_font_size(int delta);
    static KeyInput keysym_to_key_input(const SDL_Keysym &keysym);
};

#endif // SDL_HOST_H
