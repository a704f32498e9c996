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

#include <r4/rectangle.hpp>
#include <r4/vector.hpp>

#include "config.hpp"

namespace exicon {

inline real clamp(real x, real lo = 0, real hi = 1) noexcept
{
	if (x < lo) {
		return lo;
	}
	if (x > hi) {
		return hi;
	}
	return x;
}

/**
 * @brief Distance from point to line segment.
 * In case the segment is degenerate (zero length) the distance to its start point is returned.
 * @param p - point to measure distance from.
 * @param a - segment start point.
 * @param b - segment end point.
 * @return Euclidean distance from the point to the closest point of the segment.
 */
real distance_point_segment(const r4::vector2<real>& p, const r4::vector2<real>& a, const r4::vector2<real>& b);

/**
 * @brief Signed distance to a rounded rectangle.
 * @param p - point to measure distance from.
 * @param rect - bounding rectangle of the rounded rectangle, position is its top left corner.
 * @param radius - corner radius.
 * @return Negative value inside, zero on the boundary, positive value outside.
 */
real sdf_round_rect(const r4::vector2<real>& p, const r4::rectangle<real>& rect, real radius);

/**
 * @brief Check if point lies within the rectangle.
 * Rectangle edges are considered to belong to the rectangle.
 */
bool rect_contains(const r4::vector2<real>& p, const r4::rectangle<real>& rect) noexcept;

/**
 * @brief Unnormalized 2D Gaussian.
 * @param p - point to evaluate at.
 * @param center - peak position.
 * @param sigma - standard deviation.
 * @return Value in range (0:1], equals 1 at the center.
 */
real gaussian(const r4::vector2<real>& p, const r4::vector2<real>& center, real sigma);

} // namespace exicon
