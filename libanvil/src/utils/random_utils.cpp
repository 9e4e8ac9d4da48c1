#include "../../include/random_utils.hpp"
#include <algorithm>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

unsigned long long RandomUtils::next_u64() {
    return dist(rng);
}

std::string RandomUtils::random_suffix(const std::size_t length) {
    static constexpr char kHex[] = "0123456789abcdef";
    auto value = next_u64();
    std::string out;
    const std::size_t n = std::min<std::size_t>(length, 16);
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(kHex[value & 0xF]);
        value >>= 4;
    }
    return out;
}
