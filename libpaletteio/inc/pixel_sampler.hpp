#pragma once

#include <stdint.h>
#include <filesystem>
#include <vector>

#include <color.hpp>

//pixels with less alpha than this are not sampled
static const uint8_t SAMPLE_ALPHA_CUTOFF = 128;

//collects every stride'th pixel of an RGBA buffer. out is appended to
void sample_pixels(const uint8_t* rgba, int width, int height, std::vector<Pal::Color>& out, int stride = 1);

//decodes any format stb_image understands and samples it
bool sample_image(const std::filesystem::path& fileIn, std::vector<Pal::Color>& out, int stride = 1);
