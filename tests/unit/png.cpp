#include <tst/set.hpp>
#include <tst/check.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

#include <papki/fs_file.hpp>
#include <rasterimage/image_variant.hpp>
#include <zlib.h>

#include "../../src/exicon/png.hpp"
#include "../../src/exicon/render.hpp"

namespace{
struct chunk{
	std::string type;
	std::vector<uint8_t> payload;
	uint32_t crc;
};

uint32_t read_uint32_be(const std::vector<uint8_t>& buf, size_t pos){
	return (uint32_t(buf.at(pos)) << 24) | (uint32_t(buf.at(pos + 1)) << 16) | (uint32_t(buf.at(pos + 2)) << 8) |
		uint32_t(buf.at(pos + 3));
}

std::vector<chunk> parse_chunks(const std::vector<uint8_t>& png){
	std::vector<chunk> ret;

	size_t pos = exicon::png::signature.size();
	while(pos < png.size()){
		chunk c;
		auto length = read_uint32_be(png, pos);
		pos += 4;
		c.type = std::string(png.begin() + pos, png.begin() + pos + 4);
		pos += 4;
		c.payload = std::vector<uint8_t>(png.begin() + pos, png.begin() + pos + length);
		pos += length;
		c.crc = read_uint32_be(png, pos);
		pos += 4;
		ret.push_back(std::move(c));
	}

	return ret;
}

uint32_t chunk_crc(const chunk& c){
	uLong crc = crc32(0, Z_NULL, 0);
	// NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
	crc = crc32(crc, reinterpret_cast<const Bytef*>(c.type.data()), uInt(c.type.size()));
	crc = crc32(crc, c.payload.data(), uInt(c.payload.size()));
	return uint32_t(crc);
}

std::vector<uint8_t> zlib_uncompress(const std::vector<uint8_t>& data, size_t expected_size){
	std::vector<uint8_t> ret(expected_size);
	auto size = uLongf(ret.size());
	int res = uncompress(ret.data(), &size, data.data(), uLong(data.size()));
	if(res != Z_OK){
		throw std::runtime_error("uncompress() failed, error = " + std::to_string(res));
	}
	ret.resize(size);
	return ret;
}
}

namespace{
const tst::set set("png", [](tst::suite& suite){
	suite.add<unsigned>(
		"encode__structure",
		{16, 32},
		[](const auto& size){
			auto scanlines = exicon::render(size);
			auto png = exicon::png::encode(size, size, scanlines);

			tst::check(png.size() > exicon::png::signature.size(), SL);
			tst::check(std::equal(exicon::png::signature.begin(), exicon::png::signature.end(), png.begin()), SL);

			auto chunks = parse_chunks(png);

			tst::check_eq(chunks.size(), size_t(3), SL);
			tst::check_eq(chunks[0].type, std::string("IHDR"), SL);
			tst::check_eq(chunks[1].type, std::string("IDAT"), SL);
			tst::check_eq(chunks[2].type, std::string("IEND"), SL);

			for(const auto& c : chunks){
				tst::check_eq(c.crc, chunk_crc(c), SL) << "chunk = " << c.type;
			}

			const auto& ihdr = chunks[0].payload;
			tst::check_eq(ihdr.size(), size_t(13), SL);
			tst::check_eq(read_uint32_be(ihdr, 0), uint32_t(size), SL);
			tst::check_eq(read_uint32_be(ihdr, 4), uint32_t(size), SL);
			tst::check_eq(unsigned(ihdr[8]), 8u, SL); // bit depth
			tst::check_eq(unsigned(ihdr[9]), 6u, SL); // color type
			tst::check_eq(unsigned(ihdr[10]), 0u, SL); // compression
			tst::check_eq(unsigned(ihdr[11]), 0u, SL); // filter
			tst::check_eq(unsigned(ihdr[12]), 0u, SL); // interlace

			tst::check(chunks[2].payload.empty(), SL);

			auto inflated = zlib_uncompress(chunks[1].payload, scanlines.size());
			tst::check(inflated == scanlines, SL) << "IDAT content does not match the scanlines";
		}
	);

	suite.add(
		"encode__iend_chunk_bytes",
		[](){
			auto png = exicon::png::encode(exicon::rasterize({2, 1}));

			// IEND is always the same 12 bytes: zero length, tag, CRC of the tag
			const std::vector<uint8_t> iend = {0, 0, 0, 0, 'I', 'E', 'N', 'D', 0xae, 0x42, 0x60, 0x82};

			tst::check(png.size() > iend.size(), SL);
			tst::check(std::equal(iend.begin(), iend.end(), png.end() - iend.size()), SL);
		}
	);

	suite.add(
		"encode__invalid_arguments_throw",
		[](){
			std::vector<uint8_t> buf(1 + 4 * 4, 0);

			auto throws = [](auto&& f){
				try{
					f();
				}catch(std::invalid_argument&){
					return true;
				}
				return false;
			};

			tst::check(throws([&](){exicon::png::encode(0, 1, buf);}), SL);
			tst::check(throws([&](){exicon::png::encode(4, 0, buf);}), SL);
			tst::check(throws([&](){exicon::png::encode(4, 2, buf);}), SL);
			tst::check(throws([&](){exicon::png::encode(3, 1, buf);}), SL);
			tst::check(!throws([&](){exicon::png::encode(4, 1, buf);}), SL);
		}
	);

	suite.add<unsigned>(
		"write__decoded_pixels_match_rasterizer_output",
		{16, 32},
		[](const auto& size){
			exicon::parameters params;
			params.size = size;

			auto im = exicon::rasterize(params);

			papki::fs_file fi("png_test_" + std::to_string(size) + ".png");
			exicon::png::write(fi, exicon::png::encode(im));

			auto png_var = rasterimage::read_png(fi);

			tst::check(!png_var.empty(), SL);
			tst::check(png_var.get_format() == rasterimage::format::rgba, SL)
				<< "PNG color format is not rgba: " << unsigned(png_var.get_format());
			tst::check(png_var.get_depth() == rasterimage::depth::uint_8_bit, SL)
				<< "PNG color depth is not 8 bit: " << unsigned(png_var.get_depth());
			tst::check(png_var.dims() == im.dims(), SL)
				<< "decoded dims " << png_var.dims() << " did not match " << im.dims();

			const auto& png = png_var.get<rasterimage::format::rgba>();

			tst::check_eq(png.pixels().size(), size_t(size) * size, SL);

			for(size_t i = 0; i != im.pixels().size(); ++i){
				tst::check(png.pixels()[i] == im.pixels()[i], SL)
					<< "pixel #" << i << " decoded = " << png.pixels()[i].to<unsigned>()
					<< ", rendered = " << im.pixels()[i].to<unsigned>();
			}
		}
	);
});
}
