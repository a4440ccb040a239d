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
#include "sdl_host.h"

#include <algorithm>
#include <iostream>

// Colors of the panel when the program does not choose any
static const SDL_Color default_fg = { 255, 255, 255, 255 };
static const SDL_Color default_bg = { 0, 0, 0, 255 };

SdlHost::SdlHost(const SessionOptions &options, int cols, int rows, const std::string &font_path,
                 int font_size)
    : options(options), term_cols(cols), term_rows(rows), font_size(font_size), font_path(font_path)
{
    if (!this->font_path.empty())
        return;
#ifdef __APPLE__
    this->font_path = "/System/Library/Fonts/Menlo.ttc";
#else
    this->font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";
#endif
}

SdlHost::~SdlHost()
{
    // Stop the program before SDL goes away.
    session.reset();

    for (int row = 0; row < static_cast<int>(texture_cache.size()); ++row) {
        clear_row(row);
    }
    if (renderer)
        SDL_DestroyRenderer(renderer);
    if (window)
        SDL_DestroyWindow(window);
    if (font)
        TTF_CloseFont(font);
    TTF_Quit();
    SDL_Quit();
}

bool SdlHost::initialize()
{
    if (!initialize_sdl())
        return false;

    session = std::make_unique<Session>(options, *this);

    // Reporting the size lets the session start its program.
    resize_panel(term_cols, term_rows);
    return true;
}

bool SdlHost::initialize_sdl()
{
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    if (TTF_Init() < 0) {
        std::cerr << "TTF_Init failed: " << TTF_GetError() << std::endl;
        return false;
    }
    if (!open_font(font_size)) {
        std::cerr << "Failed to load font: " << TTF_GetError() << std::endl;
        return false;
    }

    window = SDL_CreateWindow("Terminal Panel", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              term_cols * char_width, term_rows * char_height,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "Cannot access GUI display.\n";
        std::cerr << "Please ensure a graphical environment is available.\n";
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << std::endl;
        return false;
    }
    return true;
}

bool SdlHost::open_font(int size)
{
    TTF_Font *new_font = TTF_OpenFont(font_path.c_str(), size);
    if (!new_font)
        return false;

    int w = 0, h = 0;
    TTF_SizeText(new_font, "M", &w, &h);
    if (w == 0 || h == 0) {
        std::cerr << "Failed to get font metrics for size " << size << std::endl;
        TTF_CloseFont(new_font);
        return false;
    }
    if (font)
        TTF_CloseFont(font);
    font        = new_font;
    font_size   = size;
    char_width  = w;
    char_height = h;
    return true;
}

void SdlHost::refresh(const Region &region)
{
    int last = std::min(region.y + region.height, static_cast<int>(dirty_lines.size()));
    for (int row = std::max(region.y, 0); row < last; ++row) {
        dirty_lines[row] = true;
    }
}

void SdlHost::refresh()
{
    std::fill(dirty_lines.begin(), dirty_lines.end(), true);
}

void SdlHost::run()
{
    running = true;
    while (running) {
        handle_events();
        if (!session->poll(10)) {
            // Final text is shown until the window is closed.
            SDL_Delay(10);
        }
        render_text();
    }
}

void SdlHost::render_text()
{
    update_texture_cache();
    render_spans();
    SDL_RenderPresent(renderer);
}

void SdlHost::clear_row(int row)
{
    for (auto &span : texture_cache[row]) {
        if (span.texture)
            SDL_DestroyTexture(span.texture);
    }
    texture_cache[row].clear();
}

void SdlHost::update_texture_cache()
{
    for (int row = 0; row < static_cast<int>(texture_cache.size()); ++row) {
        if (!dirty_lines[row])
            continue;

        clear_row(row);
        for (const auto &segment : session->render_line(row)) {
            TextSpan span;
            span.segment = segment;

            const Style &style = segment.style;
            SDL_Color fg       = default_fg;
            if (style.has_fg) {
                fg = { style.fg.r, style.fg.g, style.fg.b, 255 };
            }
            if (style.reverse) {
                fg = default_bg;
                if (style.has_bg) {
                    fg = { style.bg.r, style.bg.g, style.bg.b, 255 };
                }
            }

            int ttf_style = TTF_STYLE_NORMAL;
            if (style.bold)
                ttf_style |= TTF_STYLE_BOLD;
            if (style.italic)
                ttf_style |= TTF_STYLE_ITALIC;
            if (style.underline)
                ttf_style |= TTF_STYLE_UNDERLINE;
            if (style.strike)
                ttf_style |= TTF_STYLE_STRIKETHROUGH;
            TTF_SetFontStyle(font, ttf_style);

            SDL_Surface *surface = TTF_RenderUTF8_Blended(font, segment.text.c_str(), fg);
            if (surface) {
                span.texture = SDL_CreateTextureFromSurface(renderer, surface);
                SDL_FreeSurface(surface);
            }
            texture_cache[row].push_back(span);
        }
        TTF_SetFontStyle(font, TTF_STYLE_NORMAL);
        dirty_lines[row] = false;
    }
}

void SdlHost::render_spans()
{
    SDL_SetRenderDrawColor(renderer, default_bg.r, default_bg.g, default_bg.b, default_bg.a);
    SDL_RenderClear(renderer);

    for (int row = 0; row < static_cast<int>(texture_cache.size()); ++row) {
        for (const auto &span : texture_cache[row]) {
            const Style &style = span.segment.style;
            SDL_Color bg       = default_bg;
            if (style.has_bg) {
                bg = { style.bg.r, style.bg.g, style.bg.b, 255 };
            }
            if (style.reverse) {
                bg = default_fg;
                if (style.has_fg) {
                    bg = { style.fg.r, style.fg.g, style.fg.b, 255 };
                }
            }
            SDL_SetRenderDrawColor(renderer, bg.r, bg.g, bg.b, bg.a);
            SDL_Rect bg_rect = { span.segment.start_col * char_width, row * char_height,
                                 span.segment.width * char_width, char_height };
            SDL_RenderFillRect(renderer, &bg_rect);

            if (!span.texture)
                continue;
            int w, h;
            SDL_QueryTexture(span.texture, nullptr, nullptr, &w, &h);
            SDL_Rect dst = { span.segment.start_col * char_width, row * char_height, w, h };
            SDL_RenderCopy(renderer, span.texture, nullptr, &dst);
        }
    }
}

void SdlHost::resize_panel(int cols, int rows)
{
    term_cols = std::max(cols, 1);
    term_rows = std::max(rows, 1);

    for (int row = 0; row < static_cast<int>(texture_cache.size()); ++row) {
        clear_row(row);
    }
    texture_cache.resize(term_rows);
    dirty_lines.assign(term_rows, true);

    session->on_resize(term_cols, term_rows);
}

void SdlHost::handle_events()
{
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_QUIT:
            running = false;
            break;
        case SDL_KEYDOWN:
            handle_key_event(event.key);
            break;
        case SDL_MOUSEMOTION:
            handle_mouse_event(MouseKind::MOVE, event.motion.x, event.motion.y);
            break;
        case SDL_MOUSEBUTTONDOWN:
            handle_mouse_event(MouseKind::DOWN, event.button.x, event.button.y);
            break;
        case SDL_MOUSEBUTTONUP:
            handle_mouse_event(MouseKind::UP, event.button.x, event.button.y);
            break;
        case SDL_WINDOWEVENT:
            if (event.window.event == SDL_WINDOWEVENT_RESIZED) {
                resize_panel(event.window.data1 / char_width, event.window.data2 / char_height);
            } else if (event.window.event == SDL_WINDOWEVENT_EXPOSED) {
                refresh();
            }
            break;
        }
    }
}

void SdlHost::handle_key_event(const SDL_KeyboardEvent &key)
{
    // Handle font size changes
#ifdef __APPLE__
    if (key.keysym.mod & KMOD_GUI) {
#else
    if (key.keysym.mod & KMOD_CTRL) {
#endif
        if (key.keysym.sym == SDLK_EQUALS) {
            change_font_size(1);
            return;
        } else if (key.keysym.sym == SDLK_MINUS) {
            change_font_size(-1);
            return;
        }
    }

    KeyInput input = keysym_to_key_input(key.keysym);
    session->on_key(input);
}

void SdlHost::handle_mouse_event(MouseKind kind, int x, int y)
{
    // Dragging may report positions outside the window.
    if (x < 0 || y < 0)
        return;
    MouseInput mouse(kind, x / char_width, y / char_height);
    if (mouse.x >= term_cols || mouse.y >= term_rows)
        return;
    session->on_mouse(mouse);
}

KeyInput SdlHost::keysym_to_key_input(const SDL_Keysym &keysym)
{
    KeyInput key;

    // Map SDL2 keycodes to KeyCode enum
    switch (keysym.sym) {
    case SDLK_RETURN:
    case SDLK_KP_ENTER:
        key.code = KeyCode::ENTER;
        break;
    case SDLK_BACKSPACE:
        key.code = KeyCode::BACKSPACE;
        break;
    case SDLK_TAB:
        key.code = KeyCode::TAB;
        break;
    case SDLK_ESCAPE:
        key.code = KeyCode::ESCAPE;
        break;
    case SDLK_UP:
        key.code = KeyCode::UP;
        break;
    case SDLK_DOWN:
        key.code = KeyCode::DOWN;
        break;
    case SDLK_RIGHT:
        key.code = KeyCode::RIGHT;
        break;
    case SDLK_LEFT:
        key.code = KeyCode::LEFT;
        break;
    case SDLK_HOME:
        key.code = KeyCode::HOME;
        break;
    case SDLK_END:
        key.code = KeyCode::END;
        break;
    case SDLK_INSERT:
        key.code = KeyCode::INSERT;
        break;
    case SDLK_DELETE:
        key.code = KeyCode::DELETE;
        break;
    case SDLK_PAGEUP:
        key.code = KeyCode::PAGEUP;
        break;
    case SDLK_PAGEDOWN:
        key.code = KeyCode::PAGEDOWN;
        break;
    case SDLK_F1:
        key.code = KeyCode::F1;
        break;
    case SDLK_F2:
        key.code = KeyCode::F2;
        break;
    case SDLK_F3:
        key.code = KeyCode::F3;
        break;
    case SDLK_F4:
        key.code = KeyCode::F4;
        break;
    case SDLK_F5:
        key.code = KeyCode::F5;
        break;
    case SDLK_F6:
        key.code = KeyCode::F6;
        break;
    case SDLK_F7:
        key.code = KeyCode::F7;
        break;
    case SDLK_F8:
        key.code = KeyCode::F8;
        break;
    case SDLK_F9:
        key.code = KeyCode::F9;
        break;
    case SDLK_F10:
        key.code = KeyCode::F10;
        break;
    case SDLK_F11:
        key.code = KeyCode::F11;
        break;
    case SDLK_F12:
        key.code = KeyCode::F12;
        break;
    default:
        // Modifiers and other keys without a character
        if (keysym.sym & SDLK_SCANCODE_MASK)
            break;
        key.code      = KeyCode::CHARACTER;
        key.character = static_cast<wchar_t>(keysym.sym);
        break;
    }

    key.mod_shift = keysym.mod & KMOD_SHIFT;
    key.mod_ctrl  = keysym.mod & KMOD_CTRL;
    return key;
}

void SdlHost::change_font_size(int delta)
{
    int new_size = font_size + delta;
    if (new_size < 8 || new_size > 72)
        return;

    if (!open_font(new_size)) {
        std::cerr << "Failed to load font at size " << new_size << ": " << TTF_GetError()
                  << std::endl;
        return;
    }

    // Keep the window, change the grid.
    int win_width, win_height;
    SDL_GetWindowSize(window, &win_width, &win_height);
    resize_panel(win_width / char_width, win_height / char_height);
}
