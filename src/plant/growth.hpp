#pragma once

#include <limits>

namespace plant {

static constexpr inline double AGE_SCALE = 15.0;
static constexpr inline double AGE_EXPONENT = 2.0;
static constexpr inline double INFINITE_AGE = std::numeric_limits<double>::infinity();

// Ease in/out on [0, 1]: f(0) = 0, f(0.5) = 0.5, f(1) = 1, flat at both ends.
double smoothen_curve(double x);

// Maps minutes of age to a growth coefficient in [0, 1). Strictly increasing, f(0) = 0.
double age_coefficient(double age, double scale = AGE_SCALE, double exponent = AGE_EXPONENT);

// Exact inverse of age_coefficient on [0, 1); 1 maps to INFINITE_AGE, anything outside [0, 1] to NaN.
double inverse_age_coefficient(double coefficient, double scale = AGE_SCALE, double exponent = AGE_EXPONENT);

} // namespace plant
