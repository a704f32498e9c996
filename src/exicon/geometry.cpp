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

#include "geometry.hpp"

#include <algorithm>
#include <cmath>

#include <utki/debug.hpp>

using namespace exicon;

namespace {
// squared segment length below which the segment is treated as a point
constexpr real degenerate_segment_threshold = 1e-9;
} // namespace

real exicon::distance_point_segment(
	const r4::vector2<real>& p,
	const r4::vector2<real>& a,
	const r4::vector2<real>& b
)
{
	auto v = b - a;
	auto w = p - a;

	real c1 = v.x() * w.x() + v.y() * w.y();
	real c2 = v.x() * v.x() + v.y() * v.y();

	if (c2 <= degenerate_segment_threshold) {
		return w.norm();
	}

	real t = clamp(c1 / c2);

	auto q = a + v * t;

	return (p - q).norm();
}

real exicon::sdf_round_rect(const r4::vector2<real>& p, const r4::rectangle<real>& rect, real radius)
{
	auto half = rect.d / real(2);
	auto center = rect.p + half;

	using std::abs;
	using std::max;
	using std::min;

	real dx = abs(p.x() - center.x()) - (half.x() - radius);
	real dy = abs(p.y() - center.y()) - (half.y() - radius);

	real outside = r4::vector2<real>{max(dx, real(0)), max(dy, real(0))}.norm();
	real inside = min(max(dx, dy), real(0));

	return outside + inside - radius;
}

bool exicon::rect_contains(const r4::vector2<real>& p, const r4::rectangle<real>& rect) noexcept
{
	return rect.p.x() <= p.x() && p.x() <= rect.p.x() + rect.d.x() && //
		rect.p.y() <= p.y() && p.y() <= rect.p.y() + rect.d.y();
}

real exicon::gaussian(const r4::vector2<real>& p, const r4::vector2<real>& center, real sigma)
{
	ASSERT(sigma > 0, [&](auto& o) {
		o << "sigma = " << sigma;
	})

	auto d = p - center;

	using std::exp;
	return exp(-(d.x() * d.x() + d.y() * d.y()) / (2 * sigma * sigma));
}
