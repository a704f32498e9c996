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

#include <r4/vector.hpp>

#include "config.hpp"

namespace exicon {

/**
 * @brief Straight (non-premultiplied) RGB color.
 */
using color = r4::vector3<real>;

/**
 * @brief Premultiplied RGBA color.
 * Color channels are already multiplied by alpha, so each of r, g, b never exceeds a.
 */
using pm_color = r4::vector4<real>;

inline real lerp(real a, real b, real t) noexcept
{
	return a + (b - a) * t;
}

color lerp(const color& a, const color& b, real t) noexcept;

/**
 * @brief Make premultiplied color.
 * @param c - straight color.
 * @param alpha - opacity, clamped to [0:1].
 * @return Premultiplied color.
 */
pm_color pm(const color& c, real alpha);

/**
 * @brief Source-over compositing of premultiplied colors.
 * result = src + dst * (1 - src.a), applied to all four components.
 * @param dst - destination (background) color.
 * @param src - source (foreground) color.
 * @return Composited color.
 */
pm_color over(const pm_color& dst, const pm_color& src) noexcept;

/**
 * @brief Convert premultiplied color to straight RGBA.
 * Color channels of a practically transparent color are set to zero.
 */
r4::vector4<real> unpremultiply(const pm_color& c) noexcept;

/**
 * @brief Convert color value in range [0:1] to 8 bit channel value.
 * The value is clamped and rounded to the nearest integer.
 */
uint8_t quantize(real value) noexcept;

} // namespace exicon
