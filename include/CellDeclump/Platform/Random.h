#pragma once

/**
 * @file Random.h
 * @brief Random number generation utilities
 *
 * Provides the random source used by non-deterministic steps, such as
 * removing excess seeds from an object. Callers that need reproducible
 * output construct a Random with a fixed seed and pass it explicitly;
 * everything else falls back to the thread-local instance.
 */

#include <CellDeclump/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace Cell::Declump::Platform {

/**
 * @brief Seedable random number generator
 *
 * Uses MT19937-64. Instance() returns a thread-local generator seeded from
 * the clock and thread id.
 */
class CELLDECLUMP_API Random {
public:
    /**
     * @brief Create a generator with a fixed seed
     * @param seed Seed value
     */
    explicit Random(uint64_t seed);

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    /**
     * @brief Get thread-local random instance
     * @return Reference to thread-local Random instance
     */
    static Random& Instance();

    /**
     * @brief Reseed the generator
     * @param seed Seed value
     */
    void SetSeed(uint64_t seed);

    /**
     * @brief Get current seed (for debugging)
     */
    uint64_t GetSeed() const { return seed_; }

    // =========================================================================
    // Sampling
    // =========================================================================

    /**
     * @brief Sample k unique indices from range [0, n)
     * @param n Total number of items
     * @param k Number of items to sample (all indices if k >= n)
     * @return Vector of k unique indices, in draw order
     *
     * Every k-subset is equally likely.
     */
    std::vector<size_t> SampleIndices(size_t n, size_t k);

private:
    Random();

    // Uniform integer in [0, max)
    size_t Index(size_t max);

    std::mt19937_64 gen_;
    uint64_t seed_ = 0;
};

} // namespace Cell::Declump::Platform
