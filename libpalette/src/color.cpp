#include "color.hpp"

#include <stdio.h>
#include <ctype.h>

namespace Pal {
	std::string to_hex(const Color& color) {
		char buf[8];
		snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
		return std::string(buf);
	}

	static int hex_digit(char c) {
		if(c >= '0' && c <= '9') { return c - '0'; }
		c = (char)tolower((unsigned char)c);
		if(c >= 'a' && c <= 'f') { return c - 'a' + 10; }
		return -1;
	}

	bool parse_hex(const std::string& text, Color& out) {
		std::string digits = (!text.empty() && text[0] == '#') ? text.substr(1) : text;

		int values[6];
		for(size_t i = 0; i < digits.size() && i < 6; i++) {
			values[i] = hex_digit(digits[i]);
			if(values[i] < 0) { return false; }
		}

		if(digits.size() == 6) {
			out.r = (uint8_t)((values[0] << 4) | values[1]);
			out.g = (uint8_t)((values[2] << 4) | values[3]);
			out.b = (uint8_t)((values[4] << 4) | values[5]);
			return true;
		}
		if(digits.size() == 3) {
			out.r = (uint8_t)(values[0] * 0x11);
			out.g = (uint8_t)(values[1] * 0x11);
			out.b = (uint8_t)(values[2] * 0x11);
			return true;
		}
		return false;
	}
}
