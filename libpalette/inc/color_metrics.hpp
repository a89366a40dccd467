#pragma once

#include "color.hpp"

namespace Pal {
	//euclidean distance over r, g and b
	double distance(const Color& c1, const Color& c2);

	//WCAG 2.0 relative luminance, 0 for black up to 1 for white
	double luminance(const Color& point);

	//distance from #000000. cruder than luminance, all channels weigh the same
	double brightness(const Color& point);

	//HSV hue in whole degrees [0,360). achromatic colors give 0
	double hue(const Color& point);

	//HSV saturation as a fraction [0,1]. pure black gives 0
	double saturation(const Color& point);

	//HSV value in percent [0,100]
	double value(const Color& point);

	HSV to_hsv(const Color& point);
}
