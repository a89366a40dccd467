#pragma once

#include <stdint.h>
#include <cmath>
#include <string>

namespace Pal {
	struct Color {
		uint8_t r;
		uint8_t g;
		uint8_t b;
	};
	static_assert(sizeof(Color) == 3, "Color struct is not the correct size");

	inline bool operator==(const Color& a, const Color& b) {
		return a.r == b.r && a.g == b.g && a.b == b.b;
	}
	inline bool operator!=(const Color& a, const Color& b) {
		return !(a == b);
	}

	//hue in degrees [0,360), saturation and value in percent [0,100]
	struct HSV {
		double h;
		double s;
		double v;
	};

	//rounds .5 towards positive infinity, so -30.5 becomes -30 (std::round would give -31)
	inline double round_half_up(double v) {
		return std::floor(v + 0.5);
	}

	//clamps and rounds into a channel
	inline uint8_t to_channel(double v) {
		v = round_half_up(v);
		if(v < 0) { return 0; }
		if(v > 255) { return 255; }
		return (uint8_t)v;
	}

	//"#rrggbb", lowercase
	std::string to_hex(const Color& color);
	//accepts "#rrggbb", "rrggbb" and the short "#rgb" form
	bool parse_hex(const std::string& text, Color& out);
}
