//
// Interface to the display surface hosting the terminal.
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
#ifndef HOST_SURFACE_H
#define HOST_SURFACE_H

// Rectangle in character cells
struct Region {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;
};

//
// Display surface that shows the session. The session asks it
// to redraw parts of the screen; the surface then calls back
// Session::render_line() for the rows it repaints.
//
class HostSurface {
public:
    virtual ~HostSurface() = default;

    // Redraw given region.
    virtual void refresh(const Region &region) = 0;

    // Redraw everything.
    virtual void refresh() = 0;
};

#endif // HOST_SURFACE_H
