#pragma once

#include <cmath>
#include <random>
#include <type_traits>

static constexpr inline double PI = 3.14159265358979323846;
static constexpr inline double PI180 = PI / 180.;
static constexpr inline double C180PI = 180. / PI;

template <typename Float>
inline Float radians(Float deg) {
    static_assert(std::is_floating_point_v<Float>, "Float must be a floating point type");
    return deg * PI180;
}

template <typename Float>
inline Float degrees(Float rad) {
    static_assert(std::is_floating_point_v<Float>, "Float must be a floating point type");
    return rad * C180PI;
}

template <typename Float, typename Rng>
inline Float uniform(Rng& rng, Float lo, Float hi) {
    static_assert(std::is_floating_point_v<Float>, "Float must be a floating point type");
    std::uniform_real_distribution<Float> dist{lo, hi};
    return dist(rng);
}

template <typename Rng>
inline double random_sign(Rng& rng) {
    return uniform(rng, 0.0, 1.0) < 0.5 ? -1.0 : 1.0;
}
