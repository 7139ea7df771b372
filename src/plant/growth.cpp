#include "growth.hpp"

#include "helpers.hpp"

#include <cmath>

namespace plant {

double smoothen_curve(double x) {
    return (std::sin((x - 0.5) * PI) + 1.0) / 2.0;
}

double age_coefficient(double age, double scale, double exponent) {
    return 1.0 - 1.0 / (std::pow(age / scale, exponent) + 1.0);
}

double inverse_age_coefficient(double coefficient, double scale, double exponent) {
    if (coefficient == 1.0) {
        return INFINITE_AGE;
    }

    if (!(coefficient >= 0.0 && coefficient < 1.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    return scale * std::pow(coefficient / (1.0 - coefficient), 1.0 / exponent);
}

} // namespace plant
