/**
 * @file random_source.cpp
 * @brief Mersenne-Twister backed sources and the process-wide generator.
 */
#include "wbr/routing/random_source.hpp"
#include "wbr/config/constants.hpp"

namespace wbr::routing {

namespace {
uint64_t resolve_seed(uint64_t seed) {
    if (seed != wbr::config::constants::SEED_NONDETERMINISTIC) return seed;
    std::random_device rd;
    const uint64_t hi = rd();
    const uint64_t lo = rd();
    const uint64_t s = (hi << 32) ^ lo;
    return s ? s : 0x9E3779B97F4A7C15ULL; // keep 0 reserved for "unseeded"
}
} // namespace

MersenneSource::MersenneSource(uint64_t seed)
: seed_(resolve_seed(seed)), gen_(seed_) {}

double MersenneSource::uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(gen_);
}

RandomSource& process_random_source() {
    static SharedSource src; // process-wide singleton
    return src;
}

} // namespace wbr::routing
