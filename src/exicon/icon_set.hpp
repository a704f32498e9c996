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
#include <string>
#include <string_view>

#include "config.hpp"

namespace exicon {

struct icon_target {
	unsigned size;
	std::string_view filename;
};

constexpr std::array<icon_target, 2> icon_targets = {
	{
		{32, "favicon.png"},
		{16, "favicon@0.5x.png"},
	}
};

/**
 * @brief Create directory and all its missing parent directories.
 * @param dir - directory path, with or without trailing slash.
 * @throw std::runtime_error - in case some directory could not be created.
 */
void make_dirs(const std::string& dir);

/**
 * @brief Render and write all icon targets.
 * The output directory is created if it does not exist. Existing files are overwritten.
 * @param output_dir - directory to write icons to.
 * @param supersample - number of samples per pixel along each axis.
 */
void write_icons(const std::string& output_dir, unsigned supersample = default_supersample);

} // namespace exicon
