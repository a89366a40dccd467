#include "random_source.hpp"

#include <mutex>
#include <utility>

namespace Pal {
	void RandomSource::shuffle(std::vector<Color>& points) {
		for(size_t i = points.size(); i > 1; i--) {
			size_t j = index(i);
			std::swap(points[i - 1], points[j]);
		}
	}

	MersenneSource::MersenneSource() : _engine(std::random_device{}()) {}

	MersenneSource::MersenneSource(uint32_t seed) : _engine(seed) {}

	size_t MersenneSource::index(size_t bound) {
		std::uniform_int_distribution<size_t> dist(0, bound - 1);
		return dist(_engine);
	}

	//shared by every thread that clusters without its own source
	class LockedMersenneSource : public MersenneSource {
	public:
		size_t index(size_t bound) override {
			std::lock_guard<std::mutex> lock(_mutex);
			return MersenneSource::index(bound);
		}

	private:
		std::mutex _mutex;
	};

	RandomSource& default_random() {
		static LockedMersenneSource source;
		return source;
	}
}
