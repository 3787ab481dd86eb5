#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace code_sentinel {
namespace analyzer {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform in [0, 1).
    virtual double nextUnit() = 0;
};

// One independent stream per (seed, file, analyzer), so decisions do not
// depend on which task happens to run first.
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);
    SeededRandomSource(uint64_t seed, const std::string& file_path, const std::string& analyzer_id);

    double nextUnit() override;

    static uint64_t deriveSeed(uint64_t seed, const std::string& file_path, const std::string& analyzer_id);

private:
    std::mt19937_64 engine_;
};

class FixedRandomSource : public RandomSource {
public:
    explicit FixedRandomSource(double value) : value_(value) {}

    double nextUnit() override { return value_; }

private:
    double value_;
};

}}
