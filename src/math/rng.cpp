#include "math/rng.hpp"
#include <random>
#include <stdexcept>

namespace flit {

namespace {
inline uint64_t rotl(uint64_t x, int k) { return (x << k) | (x >> (64 - k)); }

inline uint64_t splitmix64(uint64_t& x) {
    uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}
}

Rng::Rng(uint64_t seed) {
    uint64_t x = seed;
    m_s[0] = splitmix64(x);
    m_s[1] = splitmix64(x);
    m_s[2] = splitmix64(x);
    m_s[3] = splitmix64(x);
}

Rng Rng::fromEntropy() {
    std::random_device rd;
    uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    return Rng(seed);
}

uint64_t Rng::nextU64() {
    const uint64_t result = rotl(m_s[1] * 5ULL, 7) * 9ULL;
    const uint64_t t = m_s[1] << 17;
    m_s[2] ^= m_s[0];
    m_s[3] ^= m_s[1];
    m_s[1] ^= m_s[2];
    m_s[0] ^= m_s[3];
    m_s[2] ^= t;
    m_s[3] = rotl(m_s[3], 45);
    return result;
}

uint32_t Rng::nextU32() { return static_cast<uint32_t>(nextU64() >> 32); }

double Rng::nextDouble() { return (nextU64() >> 11) * (1.0 / (1ULL << 53)); }

int Rng::nextInt(int bound) {
    if (bound <= 0) {
        throw std::invalid_argument("Rng::nextInt bound must be positive");
    }
    // Multiply-shift range reduction.
    uint64_t product = static_cast<uint64_t>(nextU32()) * static_cast<uint64_t>(bound);
    return static_cast<int>(product >> 32);
}

} // namespace flit
