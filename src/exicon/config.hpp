/*
The MIT License (MIT)

Copyright (c) 2024-2026 exicon contributors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.

*/

/* ================ LICENSE END ================ */

#pragma once

#include <cstdint>

#include <rasterimage/image.hpp>
#include <r4/vector.hpp>

namespace exicon {

using real = double;

using image_type = rasterimage::image<uint8_t, 4>;

/**
 * @brief Logical width and height of the canvas.
 * All scene geometry is defined in canvas units, the canvas spans [0:canvas_extent] on both axes
 * regardless of the output pixel resolution.
 */
constexpr real canvas_extent = 32;

constexpr unsigned default_supersample = 8;

} // namespace exicon
