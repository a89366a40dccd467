#include <vector>
#include <filesystem>
namespace fs = std::filesystem;

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include "logging.hpp"
#include "swatch.hpp"

bool write_swatch(const fs::path& fileOut, const std::vector<Pal::Color>& palette, int cell) {
	if(palette.empty()) {
		LOGERR("refusing to write an empty swatch to %s", fileOut.u8string().c_str());
		return false;
	}
	if(cell < 1) {
		LOGERR("swatch cell size %d is too small", cell);
		return false;
	}

	int width = cell * (int)palette.size();
	int height = cell;

	std::vector<uint8_t> out_data((size_t)width * height * 3);
	for(int y = 0; y < height; y++) {
		for(int x = 0; x < width; x++) {
			const Pal::Color& c = palette[x / cell];
			size_t offs = ((size_t)y * width + x) * 3;
			out_data[offs + 0] = c.r;
			out_data[offs + 1] = c.g;
			out_data[offs + 2] = c.b;
		}
	}

	if(fileOut.has_parent_path()) {
		std::error_code ec;
		fs::create_directories(fileOut.parent_path(), ec);
		if(ec) {
			LOGERR("couldn't create directory %s: %s", fileOut.parent_path().u8string().c_str(), ec.message().c_str());
			return false;
		}
	}

	if(!stbi_write_png(fileOut.u8string().c_str(), width, height, 3, out_data.data(), width * 3)) {
		LOGERR("couldn't write swatch to %s", fileOut.u8string().c_str());
		return false;
	}

	LOGVER("wrote %zu colors to %s", palette.size(), fileOut.u8string().c_str());
	return true;
}
