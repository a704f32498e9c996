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

#include <vector>

#include <rasterimage/image.hpp>

#include "config.hpp"

namespace exicon {

/**
 * @brief Icon render parameters.
 */
struct parameters {
	/**
	 * @brief Width and height of the resulting raster image in pixels.
	 */
	unsigned size = unsigned(canvas_extent);

	/**
	 * @brief Number of samples per pixel along each axis.
	 * Each pixel is sampled supersample * supersample times.
	 */
	unsigned supersample = default_supersample;
};

/**
 * @brief Render the icon to raster image.
 * Each pixel is an average of premultiplied scene samples uniformly covering the pixel's footprint,
 * converted to straight alpha.
 * @param params - render parameters.
 * @return Straight alpha RGBA image of params.size x params.size pixels.
 * @throw std::invalid_argument - in case size or supersample is zero.
 */
image_type rasterize(const parameters& params = parameters());

/**
 * @brief Convert image to PNG scanlines.
 * Each row of pixels is prefixed with filter type byte 0 (no filter).
 * @param im - image to convert.
 * @return Raw scanlines buffer.
 */
std::vector<uint8_t> to_scanlines(const image_type& im);

/**
 * @brief Render the icon to PNG scanlines.
 * @param size - width and height of the image in pixels.
 * @param supersample - number of samples per pixel along each axis.
 * @return Raw scanlines buffer.
 */
std::vector<uint8_t> render(unsigned size, unsigned supersample = default_supersample);

} // namespace exicon
