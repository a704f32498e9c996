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

#include "render.hpp"

#include <stdexcept>

#include <utki/debug.hpp>

#include "color.hpp"
#include "scene.hpp"

using namespace exicon;

image_type exicon::rasterize(const parameters& params)
{
	if (params.size == 0) {
		throw std::invalid_argument("exicon::rasterize(): size is zero");
	}
	if (params.supersample == 0) {
		throw std::invalid_argument("exicon::rasterize(): supersample is zero");
	}

	image_type im({params.size, params.size});

	const real scale = canvas_extent / real(params.size);
	const real n = real(params.supersample);
	const real num_samples = n * n;

	for (uint32_t y = 0; y != im.dims().y(); ++y) {
		auto row = im[y];
		for (uint32_t x = 0; x != im.dims().x(); ++x) {
			pm_color acc = {0, 0, 0, 0};

			for (unsigned sy = 0; sy != params.supersample; ++sy) {
				for (unsigned sx = 0; sx != params.supersample; ++sx) {
					r4::vector2<real> p = {
						(real(x) + (real(sx) + real(0.5)) / n) * scale,
						(real(y) + (real(sy) + real(0.5)) / n) * scale
					};
					acc += sample(p);
				}
			}

			auto px = unpremultiply(acc / num_samples);

			row[x] = {quantize(px.r()), quantize(px.g()), quantize(px.b()), quantize(px.a())};
		}
	}

	return im;
}

std::vector<uint8_t> exicon::to_scanlines(const image_type& im)
{
	const size_t width = im.dims().x();
	const size_t row_size = 1 + width * image_type::num_channels;

	std::vector<uint8_t> ret;
	ret.reserve(row_size * im.dims().y());

	auto pixels = im.pixels();

	for (size_t i = 0; i != pixels.size(); ++i) {
		if (i % width == 0) {
			ret.push_back(0); // filter type: none
		}
		const auto& px = pixels[i];
		ret.push_back(px.r());
		ret.push_back(px.g());
		ret.push_back(px.b());
		ret.push_back(px.a());
	}

	ASSERT(ret.size() == row_size * im.dims().y(), [&](auto& o) {
		o << "ret.size() = " << ret.size() << ", im.dims() = " << im.dims();
	})

	return ret;
}

std::vector<uint8_t> exicon::render(unsigned size, unsigned supersample)
{
	parameters params;
	params.size = size;
	params.supersample = supersample;

	return to_scanlines(rasterize(params));
}
