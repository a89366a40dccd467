#pragma once

#include <filesystem>
#include <vector>

#include <color.hpp>

//writes the palette as a row of cell x cell squares to a PNG
bool write_swatch(const std::filesystem::path& fileOut, const std::vector<Pal::Color>& palette, int cell = 32);
