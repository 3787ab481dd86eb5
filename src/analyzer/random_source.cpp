#include "code_sentinel/analyzer/random_source.hpp"

namespace code_sentinel {
namespace analyzer {

namespace {

// FNV-1a; std::hash is not stable across standard library implementations.
uint64_t fnv1a(uint64_t hash, const std::string& data) {
    constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

}

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : engine_(seed) {}

SeededRandomSource::SeededRandomSource(uint64_t seed, const std::string& file_path, const std::string& analyzer_id)
    : engine_(deriveSeed(seed, file_path, analyzer_id)) {}

uint64_t SeededRandomSource::deriveSeed(uint64_t seed, const std::string& file_path, const std::string& analyzer_id) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    hash = fnv1a(hash, file_path);
    hash = fnv1a(hash, std::string(1, '\0'));
    hash = fnv1a(hash, analyzer_id);
    return splitmix64(seed ^ hash);
}

double SeededRandomSource::nextUnit() {
    // 53 random bits, same construction on every platform.
    return static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
}

}}
