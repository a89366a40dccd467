#pragma once

#include <stddef.h>
#include <future>
#include <vector>

#include "color.hpp"
#include "random_source.hpp"

namespace Pal {
	struct KmeansOptions {
		size_t k = 6;
		size_t max_iterations = 100;
	};

	struct KmeansResult {
		std::vector<Color> centers;
		//indices into the input points, one group per center, from the last pass
		std::vector<std::vector<size_t>> clusters;
		//assignment/update passes executed, at most max_iterations + 1
		size_t passes = 0;
		bool converged = false;
	};

	//nearest center for every point. ties go to the lowest center index
	std::vector<std::vector<size_t>> assign_clusters(const std::vector<Color>& points, const std::vector<Color>& centers);

	//true when no center moved further than 1. an empty old_centers never converges
	bool centers_converged(const std::vector<Color>& old_centers, const std::vector<Color>& new_centers);

	KmeansResult kmeans_run(const std::vector<Color>& points, const KmeansOptions& options, RandomSource& random);

	//k representative colors of points, using the process-wide random source
	std::vector<Color> kmeans(const std::vector<Color>& points, size_t k = 6, size_t max_iterations = 100);

	//deferred: the clustering runs on the thread that waits on the future
	std::future<std::vector<Color>> kmeans_async(std::vector<Color> points, size_t k = 6, size_t max_iterations = 100);
}
