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

#include "color.hpp"
#include "config.hpp"

namespace exicon {

/**
 * @brief Icon silhouette.
 * A rounded square, everything outside of it is fully transparent.
 */
struct silhouette {
	// NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers)
	static constexpr real inset = 1.5;

	// NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers)
	static constexpr real corner_radius = 7;

	static r4::rectangle<real> rect() noexcept
	{
		return {
			{inset, inset},
			{canvas_extent - 2 * inset, canvas_extent - 2 * inset}
		};
	}

	/**
	 * @brief Signed distance to the silhouette boundary.
	 * @param p - point in canvas coordinates.
	 * @return Negative value inside, positive value outside.
	 */
	static real distance(const r4::vector2<real>& p);
};

/**
 * @brief Sample the icon at a point.
 * The function is pure, it returns same color for same point.
 * @param p - point in canvas coordinates, any real values are accepted.
 * @return Premultiplied color of the icon at the point.
 */
pm_color sample(const r4::vector2<real>& p);

} // namespace exicon
