#pragma once

#include <cstdint>

namespace lf {

// Small helpers shared by the battle code. Everything here is a pure function of
// its arguments so headless and live runs compute identical values.
class DeterministicMath {
public:
    static const double kPi;
    static const double kTwoPi;
    static const double kHalfPi;

    static double distance(double x1, double y1, double x2, double y2);
    static double angleBetween(double x1, double y1, double x2, double y2);
    // Wraps into [-pi, pi].
    static double wrapAngle(double angle);
    static double easeOutBack(double t);
    static double clamp01(double value);
    static std::int64_t toMicros(double value);
};

} // namespace lf
