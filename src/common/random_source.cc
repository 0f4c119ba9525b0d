#include "random_source.h"

namespace JitFhss {

SeededRandomSource::SeededRandomSource() : engine_(std::random_device{}()) {}

double SeededRandomSource::Uniform() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

int64_t SeededRandomSource::UniformInt(int64_t lo, int64_t hi) {
    if (hi < lo) {
        return lo;
    }
    std::uniform_int_distribution<int64_t> dist(lo, hi);
    return dist(engine_);
}

double SeededRandomSource::Normal() {
    std::normal_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

std::shared_ptr<RandomSource> MakeRandomSource(uint64_t seed) {
    if (seed == 0) {
        return std::make_shared<SeededRandomSource>();
    }
    return std::make_shared<SeededRandomSource>(seed);
}

}  // namespace JitFhss
