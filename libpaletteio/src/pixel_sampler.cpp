#include <vector>
#include <filesystem>
#include <stdio.h>
namespace fs = std::filesystem;

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include "logging.hpp"
#include "pixel_sampler.hpp"

void sample_pixels(const uint8_t* rgba, int width, int height, std::vector<Pal::Color>& out, int stride) {
	if(stride < 1) { stride = 1; }

	size_t pixel_count = (size_t)width * (size_t)height;
	out.reserve(out.size() + pixel_count / stride + 1);

	size_t skipped = 0;
	for(size_t i = 0; i < pixel_count; i += stride) {
		const uint8_t* px = &rgba[i * 4];
		if(px[3] < SAMPLE_ALPHA_CUTOFF) {
			skipped++;
			continue;
		}
		out.push_back(Pal::Color{px[0], px[1], px[2]});
	}

	if(skipped) {
		LOGVER("skipped %zu transparent pixels", skipped);
	}
}

bool sample_image(const fs::path& fileIn, std::vector<Pal::Color>& out, int stride) {
	int width = 0, height = 0, channels = 4;

	uint8_t* imgdata = stbi_load(fileIn.u8string().c_str(), &width, &height, &channels, 4);
	if(!imgdata) {
		LOGERR("couldn't load image %s: %s", fileIn.u8string().c_str(), stbi_failure_reason());
		return false;
	}

	LOGVER("loaded %s, %dx%d with %d channels", fileIn.u8string().c_str(), width, height, channels);

	size_t before = out.size();
	sample_pixels(imgdata, width, height, out, stride);
	stbi_image_free(imgdata);

	if(out.size() == before) {
		LOGWAR("image %s has no opaque pixels", fileIn.u8string().c_str());
		return false;
	}
	return true;
}
