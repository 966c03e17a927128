#pragma once

#include <random>
#include <cstdint>

namespace merchant {

// Seeded random source. Each owner holds its own engine so runs are
// reproducible; nothing in the library draws from a shared generator.
class Random {
public:
    explicit Random(uint32_t seed = 42) : gen_(seed) {}

    std::mt19937& engine() { return gen_; }

    void seed(uint32_t s) { gen_.seed(s); }

    // Uniform distribution [min, max)
    double uniform(double min, double max) {
        std::uniform_real_distribution<double> dist(min, max);
        return dist(gen_);
    }

    // Uniform integer [min, max]
    int uniformInt(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }

    // Normal distribution
    double normal(double mean, double stddev) {
        std::normal_distribution<double> dist(mean, stddev);
        return dist(gen_);
    }

    // Bernoulli (coin flip with probability p)
    bool bernoulli(double p) {
        std::bernoulli_distribution dist(p);
        return dist(gen_);
    }

private:
    std::mt19937 gen_;
};

} // namespace merchant
