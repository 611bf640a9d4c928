#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace morph {

/**
 * @brief Source of the randomness used for padding and per-particle sizes
 *
 * Injected into the normalizer and the particle set so tests can fix the sequence.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Uniform integer in [0, bound)
     * @param bound Exclusive upper bound, must be > 0
     */
    virtual std::size_t uniform_index(std::size_t bound) = 0;

    /**
     * @brief Uniform float in [0, 1)
     */
    virtual float uniform_unit() = 0;
};

/**
 * @brief Mersenne twister backed source
 *
 * A seed of 0 draws the actual seed from std::random_device.
 */
class SeededRandomSource final : public RandomSource {
public:
    explicit SeededRandomSource(uint32_t seed = 0);

    std::size_t uniform_index(std::size_t bound) override;
    float uniform_unit() override;

    [[nodiscard]] uint32_t seed() const { return m_seed; }

private:
    uint32_t m_seed;
    std::mt19937 m_engine;
};

} // namespace morph
