#pragma once

#include <cstdint>

namespace flit {

/**
 * @brief Seedable xoshiro256** generator.
 *
 * Output depends only on the seed and the sequence of calls, so two
 * processes that seed identically and draw in the same order see the same
 * values. Rounds that must match across players (daily challenges,
 * head-to-head matches) rely on this.
 */
class Rng {
public:
    explicit Rng(uint64_t seed);

    // Seeded from std::random_device, for rounds that need not repeat.
    static Rng fromEntropy();

    uint64_t nextU64();
    uint32_t nextU32();

    // [0, 1)
    double nextDouble();

    // [0, bound). bound must be positive.
    int nextInt(int bound);

private:
    uint64_t m_s[4];
};

} // namespace flit
