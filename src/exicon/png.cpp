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

#include "png.hpp"

#include <stdexcept>
#include <string>

#include <utki/debug.hpp>
#include <utki/types.hpp>
#include <utki/util.hpp>
#include <zlib.h>

#include "render.hpp"

using namespace std::string_literals;

using namespace exicon;

namespace {
void append_uint32_be(std::vector<uint8_t>& out, uint32_t value)
{
	for (unsigned shift = 3 * utki::byte_bits;; shift -= utki::byte_bits) {
		out.push_back(uint8_t((value >> shift) & utki::byte_mask));
		if (shift == 0) {
			break;
		}
	}
}

std::vector<uint8_t> zlib_compress(utki::span<const uint8_t> data)
{
	auto bound = compressBound(uLong(data.size()));

	std::vector<uint8_t> ret(bound);
	auto size = uLongf(ret.size());

	int res = compress2(ret.data(), &size, data.data(), uLong(data.size()), Z_BEST_COMPRESSION);
	if (res != Z_OK) {
		throw std::runtime_error("exicon::png::encode(): compress2() failed, error = "s + std::to_string(res));
	}

	ret.resize(size);

	return ret;
}
} // namespace

void exicon::png::append_chunk(std::vector<uint8_t>& out, const std::array<char, 4>& type, utki::span<const uint8_t> payload)
{
	append_uint32_be(out, uint32_t(payload.size()));

	auto tag = utki::make_span(
		// NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
		reinterpret_cast<const uint8_t*>(type.data()),
		type.size()
	);

	out.insert(out.end(), tag.begin(), tag.end());
	out.insert(out.end(), payload.begin(), payload.end());

	uLong crc = crc32(0, Z_NULL, 0);
	crc = crc32(crc, tag.data(), uInt(tag.size()));
	crc = crc32(crc, payload.data(), uInt(payload.size()));

	append_uint32_be(out, uint32_t(crc));
}

std::vector<uint8_t> exicon::png::encode(uint32_t width, uint32_t height, utki::span<const uint8_t> scanlines)
{
	if (width == 0 || height == 0) {
		throw std::invalid_argument("exicon::png::encode(): width or height is zero");
	}

	const size_t expected_size = size_t(height) * (1 + size_t(width) * image_type::num_channels);
	if (scanlines.size() != expected_size) {
		throw std::invalid_argument(
			"exicon::png::encode(): scanlines buffer size ("s + std::to_string(scanlines.size()) +
			") does not match image dimensions, expected " + std::to_string(expected_size)
		);
	}

	std::vector<uint8_t> ret(signature.begin(), signature.end());

	{
		std::vector<uint8_t> ihdr;
		append_uint32_be(ihdr, width);
		append_uint32_be(ihdr, height);
		ihdr.push_back(bit_depth);
		ihdr.push_back(color_type_rgba);
		ihdr.push_back(0); // compression method: deflate
		ihdr.push_back(0); // filter method: adaptive
		ihdr.push_back(0); // interlace method: none
		append_chunk(ret, {'I', 'H', 'D', 'R'}, ihdr);
	}

	append_chunk(ret, {'I', 'D', 'A', 'T'}, zlib_compress(scanlines));

	append_chunk(ret, {'I', 'E', 'N', 'D'}, utki::span<const uint8_t>());

	return ret;
}

std::vector<uint8_t> exicon::png::encode(const image_type& im)
{
	return encode(im.dims().x(), im.dims().y(), to_scanlines(im));
}

void exicon::png::write(papki::file& fi, utki::span<const uint8_t> data)
{
	papki::file::guard file_guard(fi, papki::file::mode::create);

	fi.write(data);
}
