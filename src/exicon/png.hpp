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

#include <array>
#include <cstdint>
#include <vector>

#include <papki/file.hpp>
#include <utki/span.hpp>

#include "config.hpp"

namespace exicon::png {

constexpr std::array<uint8_t, 8> signature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};

constexpr uint8_t bit_depth = 8;

// truecolor with alpha
constexpr uint8_t color_type_rgba = 6;

/**
 * @brief Append PNG chunk to the stream.
 * Chunk consists of big-endian payload length, 4 character type tag, payload
 * and big-endian CRC32 of the tag and payload.
 * @param out - stream to append the chunk to.
 * @param type - chunk type tag, e.g. "IHDR".
 * @param payload - chunk data.
 */
void append_chunk(std::vector<uint8_t>& out, const std::array<char, 4>& type, utki::span<const uint8_t> payload);

/**
 * @brief Encode 8 bit RGBA scanlines to PNG.
 * The stream consists of PNG signature, IHDR, single IDAT and IEND chunks.
 * @param width - image width in pixels.
 * @param height - image height in pixels.
 * @param scanlines - raw scanlines, each row is a filter type byte followed by width * 4 channel values.
 * @return PNG byte stream.
 * @throw std::invalid_argument - in case dimensions are zero or do not match the scanlines buffer size.
 * @throw std::runtime_error - in case compression fails.
 */
std::vector<uint8_t> encode(uint32_t width, uint32_t height, utki::span<const uint8_t> scanlines);

std::vector<uint8_t> encode(const image_type& im);

/**
 * @brief Write PNG byte stream to file.
 * The file is created or truncated.
 * @param fi - file to write to. Must not be opened.
 * @param data - PNG byte stream.
 */
void write(papki::file& fi, utki::span<const uint8_t> data);

} // namespace exicon::png
