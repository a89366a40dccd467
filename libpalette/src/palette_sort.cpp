#include "palette_sort.hpp"
#include "color_metrics.hpp"

#include <algorithm>
#include <map>

namespace Pal {
	static const std::map<std::string, metric_fn> metricMap{
		{"luminance", luminance},
		{"brightness", brightness},
		{"hue", hue},
		{"saturation", saturation},
		{"value", value},
	};

	void sort_colors_inplace(std::vector<Color>& points, bool ascending, metric_fn metric) {
		if(ascending) {
			std::stable_sort(points.begin(), points.end(), [metric](const Color& a, const Color& b) {
				return metric(a) < metric(b);
			});
		}
		else {
			std::stable_sort(points.begin(), points.end(), [metric](const Color& a, const Color& b) {
				return metric(a) > metric(b);
			});
		}
	}

	std::vector<Color> sort_colors(std::vector<Color> points, bool ascending, metric_fn metric) {
		sort_colors_inplace(points, ascending, metric);
		return points;
	}

	metric_fn metric_by_name(const std::string& name) {
		auto found = metricMap.find(name);
		if(found == metricMap.end()) { return nullptr; }
		return found->second;
	}
}
