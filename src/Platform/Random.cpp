/**
 * @file Random.cpp
 * @brief Seedable random source for seed capping
 */

#include <CellDeclump/Platform/Random.h>

#include <chrono>
#include <functional>
#include <numeric>
#include <thread>

namespace Cell::Declump::Platform {

Random& Random::Instance() {
    thread_local Random instance;
    return instance;
}

Random::Random() {
    // Clock and thread id, so thread-local instances differ
    auto nanos = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    uint64_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());
    SetSeed(static_cast<uint64_t>(nanos) ^ threadHash);
}

Random::Random(uint64_t seed) {
    SetSeed(seed);
}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);
}

size_t Random::Index(size_t max) {
    if (max == 0) return 0;
    std::uniform_int_distribution<size_t> dist(0, max - 1);
    return dist(gen_);
}

std::vector<size_t> Random::SampleIndices(size_t n, size_t k) {
    std::vector<size_t> pool(n);
    std::iota(pool.begin(), pool.end(), size_t(0));
    if (k >= n) return pool;

    // Sparse draw: rejection against a membership table
    if (k <= n / 2) {
        std::vector<size_t> picked;
        picked.reserve(k);
        std::vector<uint8_t> taken(n, 0);
        while (picked.size() < k) {
            size_t idx = Index(n);
            if (taken[idx]) continue;
            taken[idx] = 1;
            picked.push_back(idx);
        }
        return picked;
    }

    // Dense draw: first k steps of a Fisher-Yates shuffle
    for (size_t i = 0; i < k; ++i) {
        std::swap(pool[i], pool[i + Index(n - i)]);
    }
    pool.resize(k);
    return pool;
}

} // namespace Cell::Declump::Platform
