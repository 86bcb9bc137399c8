// Turtle pose and pen state owned by the interpreter.
#pragma once

#include <cmath>

namespace turtlescript {

constexpr double kPi = 3.14159265358979323846;

// Degree-based trig that is exact at multiples of 90 degrees.
inline double cosDegrees(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0) r += 360.0;
    if (r == 0.0) return 1.0;
    if (r == 90.0 || r == 270.0) return 0.0;
    if (r == 180.0) return -1.0;
    return std::cos(r * kPi / 180.0);
}

inline double sinDegrees(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0) r += 360.0;
    if (r == 0.0 || r == 180.0) return 0.0;
    if (r == 90.0) return 1.0;
    if (r == 270.0) return -1.0;
    return std::sin(r * kPi / 180.0);
}

struct TurtleState {
    static constexpr double kHomeHeading = 90.0; // 0 = east, 90 = north

    double x{0.0};
    double y{0.0};
    double heading{kHomeHeading};
    bool penDown{true};

    void reset() {
        x = 0.0;
        y = 0.0;
        heading = kHomeHeading;
        penDown = true;
    }
};

} // namespace turtlescript
