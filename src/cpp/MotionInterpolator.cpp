/**
 * @file MotionInterpolator.cpp
 * @brief Easing curve implementations
 *
 * @license MIT
 */

#include "MotionInterpolator.hpp"

#include <algorithm>
#include <cmath>

namespace motion {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double BACK_S = 1.70158;
constexpr double BACK_S_INOUT = BACK_S * 1.525;
constexpr double ELASTIC_PERIOD = 0.3;

double bounceOut(double t) {
    constexpr double n1 = 7.5625;
    constexpr double d1 = 2.75;

    if (t < 1.0 / d1) {
        return n1 * t * t;
    } else if (t < 2.0 / d1) {
        t -= 1.5 / d1;
        return n1 * t * t + 0.75;
    } else if (t < 2.5 / d1) {
        t -= 2.25 / d1;
        return n1 * t * t + 0.9375;
    }
    t -= 2.625 / d1;
    return n1 * t * t + 0.984375;
}

double inOut(double t, double power) {
    if (t < 0.5) {
        return std::pow(2.0, power - 1.0) * std::pow(t, power);
    }
    return 1.0 - std::pow(-2.0 * t + 2.0, power) / 2.0;
}

} // namespace


//=============================================================================
// EASING
//=============================================================================

double ease(double t, Easing easing) {
    // Boundary guards keep f(0) = 0 and f(1) = 1 exact for every curve
    if (t <= 0.0) return 0.0;
    if (t >= 1.0) return 1.0;

    switch (easing) {
        case Easing::Linear:      return t;

        case Easing::QuadIn:      return t * t;
        case Easing::QuadOut:     return 1.0 - (1.0 - t) * (1.0 - t);
        case Easing::QuadInOut:   return inOut(t, 2.0);

        case Easing::CubicIn:     return t * t * t;
        case Easing::CubicOut:    return 1.0 - std::pow(1.0 - t, 3.0);
        case Easing::CubicInOut:  return inOut(t, 3.0);

        case Easing::QuartIn:     return std::pow(t, 4.0);
        case Easing::QuartOut:    return 1.0 - std::pow(1.0 - t, 4.0);
        case Easing::QuartInOut:  return inOut(t, 4.0);

        case Easing::QuintIn:     return std::pow(t, 5.0);
        case Easing::QuintOut:    return 1.0 - std::pow(1.0 - t, 5.0);
        case Easing::QuintInOut:  return inOut(t, 5.0);

        case Easing::SineIn:      return 1.0 - std::cos(t * PI / 2.0);
        case Easing::SineOut:     return std::sin(t * PI / 2.0);
        case Easing::SineInOut:   return -(std::cos(PI * t) - 1.0) / 2.0;

        case Easing::ExpoIn:      return std::pow(2.0, 10.0 * t - 10.0);
        case Easing::ExpoOut:     return 1.0 - std::pow(2.0, -10.0 * t);
        case Easing::ExpoInOut:
            return t < 0.5 ? std::pow(2.0, 20.0 * t - 10.0) / 2.0
                           : (2.0 - std::pow(2.0, -20.0 * t + 10.0)) / 2.0;

        case Easing::CircIn:      return 1.0 - std::sqrt(1.0 - t * t);
        case Easing::CircOut:     return std::sqrt(1.0 - (t - 1.0) * (t - 1.0));
        case Easing::CircInOut:
            return t < 0.5 ? (1.0 - std::sqrt(1.0 - 4.0 * t * t)) / 2.0
                           : (std::sqrt(1.0 - std::pow(-2.0 * t + 2.0, 2.0)) + 1.0) / 2.0;

        case Easing::BackIn:
            return t * t * ((BACK_S + 1.0) * t - BACK_S);
        case Easing::BackOut: {
            double u = t - 1.0;
            return 1.0 + u * u * ((BACK_S + 1.0) * u + BACK_S);
        }
        case Easing::BackInOut:
            return t < 0.5
                ? (std::pow(2.0 * t, 2.0) * ((BACK_S_INOUT + 1.0) * 2.0 * t - BACK_S_INOUT)) / 2.0
                : (std::pow(2.0 * t - 2.0, 2.0) * ((BACK_S_INOUT + 1.0) * (2.0 * t - 2.0) + BACK_S_INOUT) + 2.0) / 2.0;

        case Easing::ElasticIn: {
            double s = ELASTIC_PERIOD / 4.0;
            return -std::pow(2.0, 10.0 * (t - 1.0)) * std::sin((t - 1.0 - s) * (2.0 * PI) / ELASTIC_PERIOD);
        }
        case Easing::ElasticOut: {
            double s = ELASTIC_PERIOD / 4.0;
            return std::pow(2.0, -10.0 * t) * std::sin((t - s) * (2.0 * PI) / ELASTIC_PERIOD) + 1.0;
        }

        case Easing::BounceIn:    return 1.0 - bounceOut(1.0 - t);
        case Easing::BounceOut:   return bounceOut(t);

        case Easing::Organic:
            return t + 0.1 * std::sin(t * PI * 4.0) * (1.0 - t);
        case Easing::Mechanical:
            return t * t * (3.0 - 2.0 * t);
        case Easing::Emotional:
            return t + 0.15 * std::sin(t * PI * 2.0) * (1.0 - t) * t;
    }
    return t;
}


//=============================================================================
// INTERPOLATION
//=============================================================================

double interpolate(double t, double start, double end, Easing easing, double overshoot) {
    t = std::clamp(t, 0.0, 1.0);
    double travel = end - start;
    double position = start + travel * ease(t, easing);

    if (overshoot > 0.0 && t > 0.3 && t < 0.8) {
        position += travel * overshoot * std::sin((t - 0.3) * PI / 0.5);
    }
    return position;
}

int clampToLimits(double position, const ActuatorLimits& limits) {
    long rounded = std::lround(position);
    return static_cast<int>(std::clamp<long>(rounded, limits.min_position, limits.max_position));
}

} // namespace motion
