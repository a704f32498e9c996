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

#include <string>

#include <utki/debug.hpp>
#include <utki/time.hpp>

#include "../exicon/icon_set.hpp"

namespace {
const std::string default_output_dir = "addon/content/icons/";
} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape): fatal exceptions are not caught
int main(int argc, char** argv)
{
	std::string output_dir = default_output_dir;
	if (argc >= 2) {
		// NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
		output_dir = argv[1];
	}

#ifdef DEBUG
	auto start_ms = utki::get_ticks_ms();
#endif

	exicon::write_icons(output_dir);

	LOG([&](auto& o) {
		o << "icons rendered in " << float(utki::get_ticks_ms() - start_ms) / 1000.0f << " sec." << std::endl;
	})

	return 0;
}
