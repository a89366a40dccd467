#include "monochromatic.hpp"
#include "color_metrics.hpp"
#include "hsv.hpp"

namespace Pal {
	std::vector<Color> monochromatic_colors(const Color& point, size_t step) {
		const HSV origin = to_hsv(point);
		const double n = (double)(step + 1);

		const double dark_s = round_half_up(origin.s / n);
		const double dark_v = round_half_up((100 - origin.v) / n);
		const double light_s = round_half_up((100 - origin.s) / n);
		const double light_v = round_half_up(origin.v / n);

		std::vector<HSV> hsv_points;
		hsv_points.reserve(2 * (step + 1) + 1);

		for(size_t i = 0; i <= step; i++) {
			hsv_points.push_back(HSV{origin.h, i * dark_s, 100 - i * dark_v});
		}
		hsv_points.push_back(origin);
		for(size_t i = step + 1; i-- > 0;) {
			hsv_points.push_back(HSV{origin.h, 100 - i * light_s, i * light_v});
		}

		std::vector<Color> out;
		out.reserve(hsv_points.size());
		for(const HSV& p : hsv_points) {
			out.push_back(hsv_to_rgb(p));
		}
		return out;
	}
}
