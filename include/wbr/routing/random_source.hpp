#pragma once
/**
 * @file random_source.hpp
 * @brief Pluggable uniform random source used by the sampler.
 * @details Tests inject deterministic sources; production uses a seeded
 *          Mersenne-Twister or the process-level shared generator.
 */

#include <cstdint>
#include <mutex>
#include <random>

namespace wbr::routing {

    class RandomSource {
    public:
        virtual ~RandomSource() = default;

        /**
         * @brief Draw a uniformly distributed value.
         * @param lo Inclusive lower bound.
         * @param hi Upper bound (exclusive for the built-in sources).
         */
        virtual double uniform(double lo, double hi) = 0;
    };

    /** @class MersenneSource
     *  @brief std::mt19937_64-backed source. Not thread-safe; one per evaluation thread.
     */
    class MersenneSource final : public RandomSource {
    public:
        /// Seed 0 draws a nondeterministic seed from std::random_device.
        explicit MersenneSource(uint64_t seed = 0);

        double uniform(double lo, double hi) override;

        /// Seed actually used (after resolving 0).
        uint64_t seed() const noexcept { return seed_; }

    private:
        uint64_t        seed_;
        std::mt19937_64 gen_;
    };

    /** @class SharedSource
     *  @brief Mutex-guarded wrapper so parallel evaluations may share one generator.
     */
    class SharedSource final : public RandomSource {
    public:
        explicit SharedSource(uint64_t seed = 0) : inner_(seed) {}

        double uniform(double lo, double hi) override {
            std::lock_guard<std::mutex> lk(mu_);
            return inner_.uniform(lo, hi);
        }

    private:
        std::mutex     mu_;
        MersenneSource inner_;
    };

    /// Process-level generator (nondeterministically seeded singleton).
    RandomSource& process_random_source();

} // namespace wbr::routing
