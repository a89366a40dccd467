#include "color_metrics.hpp"

#include <algorithm>
#include <cmath>

namespace Pal {
	double distance(const Color& c1, const Color& c2) {
		double dr = (double)c1.r - c2.r;
		double dg = (double)c1.g - c2.g;
		double db = (double)c1.b - c2.b;
		return std::sqrt(dr * dr + dg * dg + db * db);
	}

	static double linearize(uint8_t channel) {
		double s_val = channel / 255.0;
		if(s_val <= 0.03928) {
			return s_val / 12.92;
		}
		return std::pow((s_val + 0.055) / 1.055, 2.4);
	}

	double luminance(const Color& point) {
		return 0.2126 * linearize(point.r)
			+ 0.7152 * linearize(point.g)
			+ 0.0722 * linearize(point.b);
	}

	double brightness(const Color& point) {
		return distance(point, Color{0, 0, 0});
	}

	double hue(const Color& point) {
		int r = point.r, g = point.g, b = point.b;
		int max = std::max({r, g, b});
		int min = std::min({r, g, b});
		if(max == min) { return 0; }

		double delta = max - min;
		double h;
		if(max == r) {
			//fmod keeps the sign, negative sectors get wrapped below
			h = std::fmod((g - b) / delta, 6.0);
		}
		else if(max == g) {
			h = (b - r) / delta + 2;
		}
		else {
			h = (r - g) / delta + 4;
		}

		h = round_half_up(h * 60);
		if(h < 0) { h += 360; }
		return h;
	}

	double saturation(const Color& point) {
		int max = std::max({point.r, point.g, point.b});
		int min = std::min({point.r, point.g, point.b});
		if(max == 0) { return 0; }
		return (max / 255.0 - min / 255.0) / (max / 255.0);
	}

	double value(const Color& point) {
		return std::max({point.r, point.g, point.b}) / 255.0 * 100;
	}

	HSV to_hsv(const Color& point) {
		return HSV{hue(point), saturation(point) * 100, value(point)};
	}
}
