#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace JitFhss {

/**
 * Source of randomness for failure injection, frequency draws and channel
 * perturbations. Injected so scenarios are reproducible under test.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform in [0, 1)
    virtual double Uniform() = 0;
    // Uniform integer in [lo, hi]
    virtual int64_t UniformInt(int64_t lo, int64_t hi) = 0;
    // Standard normal
    virtual double Normal() = 0;
};

/**
 * Mersenne-twister backed RandomSource.
 */
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}

    // Seeded from std::random_device
    SeededRandomSource();

    double Uniform() override;
    int64_t UniformInt(int64_t lo, int64_t hi) override;
    double Normal() override;

    void Reseed(uint64_t seed) { engine_.seed(seed); }

private:
    std::mt19937_64 engine_;
};

std::shared_ptr<RandomSource> MakeRandomSource(uint64_t seed);

}  // namespace JitFhss
