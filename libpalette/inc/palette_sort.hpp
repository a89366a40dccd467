#pragma once

#include <string>
#include <vector>

#include "color.hpp"

namespace Pal {
	typedef double (*metric_fn)(const Color& point);

	//stable. returns a sorted copy, the caller's palette is left alone
	std::vector<Color> sort_colors(std::vector<Color> points, bool ascending, metric_fn metric);
	void sort_colors_inplace(std::vector<Color>& points, bool ascending, metric_fn metric);

	//"luminance", "brightness", "hue", "saturation" or "value". nullptr for anything else
	metric_fn metric_by_name(const std::string& name);
}
