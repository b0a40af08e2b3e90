/**
 * @file ids.cpp
 * @brief Identifier generation.
 * @author Dimitris Kafetzis
 */

#include "core/ids.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <random>

namespace cluster_pilot {

namespace {

uint64_t process_salt() {
    static const uint64_t salt = [] {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        return gen();
    }();
    return salt;
}

// splitmix64 finalizer: spreads consecutive counters across the id space.
uint64_t mix(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

}  // namespace

std::string generate_id(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    auto n = counter.fetch_add(1, std::memory_order_relaxed);
    return std::format("{}-{:016x}", prefix, mix(process_salt() ^ mix(n)));
}

}  // namespace cluster_pilot
