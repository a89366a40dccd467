#include "kmeans.hpp"
#include "color_metrics.hpp"

#include <stdint.h>
#include <utility>

#include "logging.hpp"

namespace Pal {
	std::vector<std::vector<size_t>> assign_clusters(const std::vector<Color>& points, const std::vector<Color>& centers) {
		std::vector<std::vector<size_t>> clusters(centers.size());
		if(centers.empty()) { return clusters; }

		for(size_t i = 0; i < points.size(); i++) {
			size_t target = 0;
			double min_dist = distance(centers[0], points[i]);
			for(size_t k = 1; k < centers.size(); k++) {
				double dist = distance(centers[k], points[i]);
				if(dist < min_dist) {
					min_dist = dist;
					target = k;
				}
			}
			clusters[target].push_back(i);
		}
		return clusters;
	}

	//returns amount of centers that had points in their group
	static size_t compute_centers(const std::vector<Color>& points, const std::vector<std::vector<size_t>>& clusters, std::vector<Color>& centers, RandomSource& random) {
		size_t k_matched = 0;

		for(size_t k = 0; k < clusters.size(); k++) {
			if(clusters[k].empty()) {
				centers[k] = points[random.index(points.size())];
				LOGVER("center %zu had no points, reseeded to %s", k, to_hex(centers[k]).c_str());
				continue;
			}

			uint64_t sum_r = 0, sum_g = 0, sum_b = 0;
			for(size_t i : clusters[k]) {
				sum_r += points[i].r;
				sum_g += points[i].g;
				sum_b += points[i].b;
			}
			double count = (double)clusters[k].size();
			centers[k] = Color{
				to_channel(sum_r / count),
				to_channel(sum_g / count),
				to_channel(sum_b / count)
			};
			k_matched++;
		}

		return k_matched;
	}

	bool centers_converged(const std::vector<Color>& old_centers, const std::vector<Color>& new_centers) {
		if(old_centers.empty()) { return false; }
		for(size_t i = 0; i < old_centers.size() && i < new_centers.size(); i++) {
			if(distance(old_centers[i], new_centers[i]) > 1) { return false; }
		}
		return true;
	}

	static std::vector<Color> initial_centers(const std::vector<Color>& points, size_t k, RandomSource& random) {
		std::vector<Color> shuffled = points;
		random.shuffle(shuffled);

		std::vector<Color> centers;
		centers.reserve(k);
		for(size_t i = 0; i < k && i < shuffled.size(); i++) {
			centers.push_back(shuffled[i]);
		}
		if(centers.size() < k) {
			LOGWAR("asked for %zu clusters but only %zu points were supplied, padding with random picks", k, points.size());
			while(centers.size() < k) {
				centers.push_back(points[random.index(points.size())]);
			}
		}
		return centers;
	}

	KmeansResult kmeans_run(const std::vector<Color>& points, const KmeansOptions& options, RandomSource& random) {
		LOGBLK

		KmeansResult result;
		if(points.empty()) {
			LOGERR("no points to cluster");
			return result;
		}
		if(options.k == 0) {
			LOGERR("cluster count must be at least 1");
			return result;
		}

		std::vector<Color> centers = initial_centers(points, options.k, random);
		std::vector<Color> old_centers;

		size_t iterations = 0;
		while(!centers_converged(old_centers, centers) && iterations++ <= options.max_iterations) {
			old_centers = centers;
			result.clusters = assign_clusters(points, centers);
			size_t k_matched = compute_centers(points, result.clusters, centers, random);
			result.passes++;
			LOGVER("pass %zu: %zu/%zu centers had points in their group", result.passes, k_matched, centers.size());
		}

		result.converged = centers_converged(old_centers, centers);
		if(result.converged) {
			LOGVER("converged after %zu passes", result.passes);
		}
		else {
			LOGVER("stopped after %zu passes without converging", result.passes);
		}

		result.centers = std::move(centers);
		return result;
	}

	std::vector<Color> kmeans(const std::vector<Color>& points, size_t k, size_t max_iterations) {
		KmeansOptions options;
		options.k = k;
		options.max_iterations = max_iterations;
		return kmeans_run(points, options, default_random()).centers;
	}

	std::future<std::vector<Color>> kmeans_async(std::vector<Color> points, size_t k, size_t max_iterations) {
		return std::async(std::launch::deferred, [points = std::move(points), k, max_iterations]() {
			return kmeans(points, k, max_iterations);
		});
	}
}
