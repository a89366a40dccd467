#pragma once

#include "color.hpp"

namespace Pal {
	//h in degrees (wrapped into [0,360)), s and v in percent (clamped to [0,100])
	Color hsv_to_rgb(double h, double s, double v);

	inline Color hsv_to_rgb(const HSV& hsv) {
		return hsv_to_rgb(hsv.h, hsv.s, hsv.v);
	}
}
