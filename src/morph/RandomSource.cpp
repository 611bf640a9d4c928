#include "morph/RandomSource.hpp"

#include <algorithm>
#include <cmath>

namespace morph {

namespace {

uint32_t resolve_seed(uint32_t seed) {
    if (seed != 0)
        return seed;
    std::random_device rd;
    return rd();
}

} // anonymous namespace

SeededRandomSource::SeededRandomSource(uint32_t seed)
    : m_seed(resolve_seed(seed))
    , m_engine(m_seed)
{
}

std::size_t SeededRandomSource::uniform_index(std::size_t bound) {
    if (bound <= 1)
        return 0;
    std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
    return dist(m_engine);
}

float SeededRandomSource::uniform_unit() {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    // uniform_real_distribution<float> can round up to 1.0f on some implementations
    return std::min(dist(m_engine), std::nextafter(1.0f, 0.0f));
}

} // namespace morph
