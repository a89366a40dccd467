#pragma once

#include <stddef.h>
#include <vector>

#include "color.hpp"

namespace Pal {
	//gradient sharing the hue of point: step + 1 tints starting at white, point itself, then step + 1 shades ending at black.
	//always 2 * (step + 1) + 1 colors long, with point's HSV round trip at index step + 1
	std::vector<Color> monochromatic_colors(const Color& point, size_t step = 3);
}
