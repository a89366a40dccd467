#pragma once

#include <stddef.h>
#include <stdint.h>
#include <random>
#include <vector>

#include "color.hpp"

namespace Pal {
	//picks indices for the clusterer. swap it out in tests to get reproducible runs
	class RandomSource {
	public:
		virtual ~RandomSource() = default;

		//uniformly distributed index in [0, bound). bound is never 0
		virtual size_t index(size_t bound) = 0;

		//Fisher-Yates, driven by index()
		void shuffle(std::vector<Color>& points);
	};

	class MersenneSource : public RandomSource {
	public:
		MersenneSource();
		explicit MersenneSource(uint32_t seed);

		size_t index(size_t bound) override;

	private:
		std::mt19937 _engine;
	};

	//process-wide source, seeded from std::random_device. safe to use from several threads
	RandomSource& default_random();
}
