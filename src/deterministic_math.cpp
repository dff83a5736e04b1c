#include "deterministic_math.hpp"

#include <cmath>

#include <boost/math/constants/constants.hpp>

namespace lf {

const double DeterministicMath::kPi = boost::math::constants::pi<double>();
const double DeterministicMath::kTwoPi = boost::math::constants::two_pi<double>();
const double DeterministicMath::kHalfPi = boost::math::constants::half_pi<double>();

double DeterministicMath::distance(double x1, double y1, double x2, double y2) {
    double dx = x2 - x1;
    double dy = y2 - y1;
    return std::sqrt(dx * dx + dy * dy);
}

double DeterministicMath::angleBetween(double x1, double y1, double x2, double y2) {
    return std::atan2(y2 - y1, x2 - x1);
}

double DeterministicMath::wrapAngle(double angle) {
    while (angle > kPi) {
        angle -= kTwoPi;
    }
    while (angle < -kPi) {
        angle += kTwoPi;
    }
    return angle;
}

double DeterministicMath::easeOutBack(double t) {
    constexpr double c1 = 1.70158;
    constexpr double c3 = c1 + 1.0;
    double u = t - 1.0;
    return 1.0 + c3 * u * u * u + c1 * u * u;
}

double DeterministicMath::clamp01(double value) {
    if (value < 0.0) {
        return 0.0;
    }
    if (value > 1.0) {
        return 1.0;
    }
    return value;
}

std::int64_t DeterministicMath::toMicros(double value) {
    return static_cast<std::int64_t>(std::llround(value * 1'000'000.0));
}

} // namespace lf
