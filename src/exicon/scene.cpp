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

#include "scene.hpp"

#include <algorithm>
#include <array>

#include <utki/debug.hpp>

#include "geometry.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)

using namespace exicon;

real silhouette::distance(const r4::vector2<real>& p)
{
	return sdf_round_rect(p, silhouette::rect(), silhouette::corner_radius);
}

namespace {

/**
 * @brief Values shared by all layers at one sample point.
 */
struct sample_point {
	r4::vector2<real> p;

	// signed distance to the silhouette boundary, never positive
	real sdf;
};

color background_color(const r4::vector2<real>& p)
{
	const color navy = {0.035, 0.075, 0.155};
	const color teal = {0.035, 0.47, 0.57};

	real t = clamp((p.x() * 0.62 + p.y() * 0.38) / canvas_extent);

	auto base = lerp(navy, teal, t);

	real glow_top_left = gaussian(p, {9.0, 7.5}, 7.5);
	real glow_bottom_right = gaussian(p, {25.5, 24.5}, 8.5);
	real glow_center = gaussian(p, {17.0, 16.0}, 10.0);

	// all glow terms are summed before clamping, so overlapping glows do not get clipped early
	return {
		clamp(base.r() + 0.10 * glow_top_left + 0.04 * glow_center + 0.03 * glow_bottom_right),
		clamp(base.g() + 0.08 * glow_top_left + 0.06 * glow_center + 0.07 * glow_bottom_right),
		clamp(base.b() + 0.13 * glow_top_left + 0.08 * glow_center + 0.03 * glow_bottom_right)
	};
}

pm_color composite_background(const sample_point& sp, const pm_color& dst)
{
	return over(dst, pm(background_color(sp.p), 1));
}

pm_color composite_edge_highlight(const sample_point& sp, const pm_color& dst)
{
	const real thickness = 1.15;

	real depth = -sp.sdf;
	if (depth < 0 || depth >= thickness) {
		return dst;
	}

	real alpha = (thickness - depth) / thickness * 0.20;
	return over(dst, pm({0.88, 0.96, 1.0}, alpha));
}

pm_color composite_edge_shadow(const sample_point& sp, const pm_color& dst)
{
	const real thickness = 2.4;
	const real top = 15.5;

	real depth = -sp.sdf;
	if (depth < 0 || depth >= thickness || sp.p.y() <= top) {
		return dst;
	}

	real alpha = (thickness - depth) / thickness * 0.10 * ((sp.p.y() - top) / (canvas_extent - top));
	return over(dst, pm({0, 0, 0}, alpha));
}

pm_color composite_guide(const sample_point& sp, const pm_color& dst)
{
	const real half_width = 0.65;

	real d = distance_point_segment(sp.p, {6.5, 26.0}, {27.5, 5.5});
	if (d > half_width) {
		return dst;
	}

	return over(dst, pm({0.75, 0.95, 1.0}, 0.08 * (1 - d / half_width)));
}

const std::array<r4::rectangle<real>, 4> e_glyph_bars = {
	{
		{{6.0, 7.0}, {3.9, 18.0}}, // stem
		{{6.0, 7.0}, {11.4, 3.7}}, // top bar
		{{6.0, 14.0}, {9.0, 3.6}}, // middle bar
		{{6.0, 21.2}, {11.4, 3.8}}, // bottom bar
	}
};

pm_color composite_e_glyph(const sample_point& sp, const pm_color& dst)
{
	bool inside = std::any_of(e_glyph_bars.begin(), e_glyph_bars.end(), [&sp](const auto& r) {
		return rect_contains(sp.p, r);
	});

	if (!inside) {
		return dst;
	}

	auto ret = over(dst, pm({0.70, 0.92, 1.0}, 0.12));
	return over(ret, pm({0.97, 0.985, 1.0}, 0.98));
}

struct x_stroke {
	r4::vector2<real> a;
	r4::vector2<real> b;
	color glow;
	color core_top;
	color core_bottom;
};

constexpr size_t num_x_strokes = 2;

const std::array<x_stroke, num_x_strokes> x_glyph_strokes = {
	{
		{{18.0, 7.8}, {26.1, 24.1}, {0.09, 0.98, 0.76}, {0.10, 0.96, 0.70}, {0.40, 1.0, 0.88}},
		{{26.0, 8.0}, {18.2, 24.1}, {0.20, 0.76, 1.0}, {0.36, 0.80, 1.0}, {0.60, 0.88, 1.0}},
	}
};

pm_color composite_x_glyph(const sample_point& sp, const pm_color& dst)
{
	const real glow_half_width = 3.0;
	const real core_half_width = 1.75;

	std::array<real, num_x_strokes> distances{};
	for (size_t i = 0; i != x_glyph_strokes.size(); ++i) {
		const auto& s = x_glyph_strokes[i];
		distances[i] = distance_point_segment(sp.p, s.a, s.b);
	}

	auto ret = dst;

	// glows of both strokes go below cores of both strokes
	for (size_t i = 0; i != x_glyph_strokes.size(); ++i) {
		real d = distances[i];
		if (d <= glow_half_width) {
			ret = over(ret, pm(x_glyph_strokes[i].glow, 0.16 * (1 - d / glow_half_width)));
		}
	}

	real t = clamp(sp.p.y() / canvas_extent);

	for (size_t i = 0; i != x_glyph_strokes.size(); ++i) {
		if (distances[i] <= core_half_width) {
			const auto& s = x_glyph_strokes[i];
			ret = over(ret, pm(lerp(s.core_top, s.core_bottom, t), 0.98));
		}
	}

	return ret;
}

pm_color composite_spark(const sample_point& sp, const pm_color& dst)
{
	const real threshold = 0.02;

	real w = gaussian(sp.p, {21.9, 15.9}, 0.75);
	if (w <= threshold) {
		return dst;
	}

	return over(dst, pm({1, 1, 1}, 0.28 * w));
}

using layer_function = pm_color (*)(const sample_point& sp, const pm_color& dst);

// back to front
const std::array<layer_function, 7> layers = {
	&composite_background,
	&composite_edge_highlight,
	&composite_edge_shadow,
	&composite_guide,
	&composite_e_glyph,
	&composite_x_glyph,
	&composite_spark,
};

} // namespace

pm_color exicon::sample(const r4::vector2<real>& p)
{
	real sdf = silhouette::distance(p);
	if (sdf > 0) {
		return {0, 0, 0, 0};
	}

	sample_point sp{p, sdf};

	pm_color ret = {0, 0, 0, 0};

	for (const auto& l : layers) {
		ret = l(sp, ret);
		ASSERT(ret.r() <= ret.a() + 1e-9 && ret.g() <= ret.a() + 1e-9 && ret.b() <= ret.a() + 1e-9, [&](auto& o) {
			o << "premultiplied invariant broken, p = " << p << ", color = " << ret;
		})
	}

	return ret;
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
