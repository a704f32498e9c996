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

#include "icon_set.hpp"

#include <stdexcept>

#include <papki/fs_file.hpp>
#include <utki/debug.hpp>

#include "png.hpp"
#include "render.hpp"

using namespace std::string_literals;

using namespace exicon;

void exicon::make_dirs(const std::string& dir)
{
	if (dir.empty()) {
		return;
	}

	// walk the path, creating every missing directory from the outermost one
	for (size_t pos = dir.find('/', 1);; pos = dir.find('/', pos + 1)) {
		auto sub_dir = pos == std::string::npos ? dir : dir.substr(0, pos);
		if (!sub_dir.empty() && sub_dir.back() != '/') {
			sub_dir.push_back('/');
		}

		papki::fs_file d(sub_dir);
		if (!d.exists()) {
			d.make_dir();
			if (!d.exists()) {
				throw std::runtime_error("exicon::make_dirs(): could not create directory: "s + sub_dir);
			}
		}

		if (pos == std::string::npos || pos + 1 == dir.size()) {
			break;
		}
	}
}

void exicon::write_icons(const std::string& output_dir, unsigned supersample)
{
	make_dirs(output_dir);

	std::string dir = output_dir;
	if (!dir.empty() && dir.back() != '/') {
		dir.push_back('/');
	}

	for (const auto& t : icon_targets) {
		parameters params;
		params.size = t.size;
		params.supersample = supersample;

		auto data = png::encode(rasterize(params));

		papki::fs_file fi(dir + std::string(t.filename));
		png::write(fi, data);

		utki::log([&](auto& o) {
			o << "wrote " << t.filename << " (" << t.size << "x" << t.size << ")" << std::endl;
		});
	}
}
