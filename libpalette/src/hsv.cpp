#include "hsv.hpp"

#include <algorithm>
#include <cmath>

namespace Pal {
	Color hsv_to_rgb(double h, double s, double v) {
		h = std::fmod(h, 360.0);
		if(h < 0) { h += 360; }
		s = std::clamp(s, 0.0, 100.0) / 100.0;
		v = std::clamp(v, 0.0, 100.0) / 100.0;

		double c = v * s;
		double x = c * (1 - std::fabs(std::fmod(h / 60.0, 2) - 1));
		double m = v - c;

		double r1, g1, b1;
		switch((int)(h / 60.0)) {
			case 0: r1 = c; g1 = x; b1 = 0; break;
			case 1: r1 = x; g1 = c; b1 = 0; break;
			case 2: r1 = 0; g1 = c; b1 = x; break;
			case 3: r1 = 0; g1 = x; b1 = c; break;
			case 4: r1 = x; g1 = 0; b1 = c; break;
			default: r1 = c; g1 = 0; b1 = x; break;
		}

		return Color{
			to_channel((r1 + m) * 255),
			to_channel((g1 + m) * 255),
			to_channel((b1 + m) * 255)
		};
	}
}
