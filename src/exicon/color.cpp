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

#include "color.hpp"

#include <cmath>
#include <limits>

#include <utki/debug.hpp>

#include "geometry.hpp"

using namespace exicon;

namespace {
// alpha at or below this value is treated as fully transparent when unpremultiplying
constexpr real transparent_alpha_epsilon = 1e-6;
} // namespace

color exicon::lerp(const color& a, const color& b, real t) noexcept
{
	return {
		lerp(a.r(), b.r(), t), //
		lerp(a.g(), b.g(), t),
		lerp(a.b(), b.b(), t)
	};
}

pm_color exicon::pm(const color& c, real alpha)
{
	real a = clamp(alpha);

	pm_color ret = {c.r() * a, c.g() * a, c.b() * a, a};

	ASSERT(ret.r() <= ret.a() && ret.g() <= ret.a() && ret.b() <= ret.a(), [&](auto& o) {
		o << "color channel exceeds alpha, c = " << c << ", alpha = " << alpha;
	})

	return ret;
}

pm_color exicon::over(const pm_color& dst, const pm_color& src) noexcept
{
	real inv = real(1) - src.a();
	return src + dst * inv;
}

r4::vector4<real> exicon::unpremultiply(const pm_color& c) noexcept
{
	if (c.a() <= transparent_alpha_epsilon) {
		return {0, 0, 0, clamp(c.a())};
	}

	return {
		clamp(c.r() / c.a()), //
		clamp(c.g() / c.a()),
		clamp(c.b() / c.a()),
		clamp(c.a())
	};
}

uint8_t exicon::quantize(real value) noexcept
{
	using std::round;
	return uint8_t(round(clamp(value) * real(std::numeric_limits<uint8_t>::max())));
}
