#include <tst/set.hpp>
#include <tst/check.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

#include <zlib.h>

#include "../../src/exicon/render.hpp"

namespace{
const size_t alpha_channel = 3;

// fraction of fully opaque pixels and mean alpha of an image
std::pair<double, double> alpha_stats(const exicon::image_type& im){
	size_t num_opaque = 0;
	double sum = 0;
	for(const auto& px : im.pixels()){
		if(px.a() == 0xff){
			++num_opaque;
		}
		sum += double(px.a()) / 0xff;
	}
	auto n = double(im.pixels().size());
	return {double(num_opaque) / n, sum / n};
}
}

namespace{
const tst::set set("render", [](tst::suite& suite){
	suite.add<unsigned>(
		"rasterize__dimensions",
		{1, 16, 32, 48},
		[](const auto& size){
			exicon::parameters params;
			params.size = size;
			params.supersample = 2;

			auto im = exicon::rasterize(params);

			tst::check(im.dims() == r4::vector2<uint32_t>{size, size}, SL) << "dims = " << im.dims();
			tst::check_eq(im.pixels().size(), size_t(size) * size, SL);
		}
	);

	suite.add(
		"rasterize__corner_is_transparent_and_center_is_opaque",
		[](){
			exicon::parameters params;
			params.size = 32;

			auto im = exicon::rasterize(params);

			tst::check_eq(unsigned(im[0][0].a()), 0u, SL);
			tst::check_eq(unsigned(im[1][1].a()), 0u, SL);
			tst::check_eq(unsigned(im[31][31].a()), 0u, SL);
			tst::check_eq(unsigned(im[16][16].a()), 255u, SL);
			tst::check_eq(unsigned(im[15][15].a()), 255u, SL);
		}
	);

	suite.add(
		"rasterize__transparent_pixels_have_zero_color",
		[](){
			auto im = exicon::rasterize();

			for(const auto& px : im.pixels()){
				if(px.a() == 0){
					tst::check(px.r() == 0 && px.g() == 0 && px.b() == 0, SL) << "px = " << px.to<unsigned>();
				}
			}
		}
	);

	suite.add(
		"rasterize__silhouette_is_consistent_between_sizes",
		[](){
			exicon::parameters params;

			params.size = 32;
			auto large = alpha_stats(exicon::rasterize(params));

			params.size = 16;
			auto small = alpha_stats(exicon::rasterize(params));

			tst::check(std::abs(large.first - small.first) < 0.05, SL)
				<< "opaque fraction: 32px = " << large.first << ", 16px = " << small.first;
			tst::check(std::abs(large.second - small.second) < 0.02, SL)
				<< "mean alpha: 32px = " << large.second << ", 16px = " << small.second;
		}
	);

	suite.add(
		"rasterize__zero_size_throws",
		[](){
			exicon::parameters params;
			params.size = 0;

			bool thrown = false;
			try{
				exicon::rasterize(params);
			}catch(std::invalid_argument&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);

	suite.add(
		"rasterize__zero_supersample_throws",
		[](){
			exicon::parameters params;
			params.supersample = 0;

			bool thrown = false;
			try{
				exicon::rasterize(params);
			}catch(std::invalid_argument&){
				thrown = true;
			}
			tst::check(thrown, SL);
		}
	);

	suite.add<unsigned>(
		"render__scanlines_layout",
		{16, 32},
		[](const auto& size){
			auto buf = exicon::render(size);

			const size_t row_size = 1 + size * 4;
			tst::check_eq(buf.size(), row_size * size, SL);

			auto im = exicon::rasterize({size, exicon::default_supersample});

			for(size_t y = 0; y != size; ++y){
				tst::check_eq(unsigned(buf[y * row_size]), 0u, SL) << "row = " << y;
				for(size_t x = 0; x != size; ++x){
					auto px = im[uint32_t(y)][x];
					for(size_t c = 0; c != 4; ++c){
						tst::check_eq(buf[y * row_size + 1 + x * 4 + c], px[c], SL);
					}
				}
			}

			// the corner pixel alpha is the last byte of its quadruple
			tst::check_eq(unsigned(buf[1 + alpha_channel]), 0u, SL);
		}
	);

	suite.add<std::pair<unsigned, uint32_t>>(
		"render__matches_golden_checksum",
		{
			{32, 0xe492441d},
			{16, 0xf1702dab}
		},
		[](const auto& golden){
			auto buf = exicon::render(golden.first);

			uLong crc = crc32(0, Z_NULL, 0);
			crc = crc32(crc, buf.data(), uInt(buf.size()));

			tst::check_eq(uint32_t(crc), golden.second, SL) << "size = " << golden.first;
		}
	);

	suite.add(
		"render__is_deterministic",
		[](){
			tst::check(exicon::render(32) == exicon::render(32), SL);
			tst::check(exicon::render(16, 4) == exicon::render(16, 4), SL);
		}
	);
});
}
