/**
 * @file MotionInterpolator.hpp
 * @brief Easing curves and position interpolation
 *
 * Pure functions, no state. The choreography engine calls these once per
 * channel per tick.
 *
 * @section Curves Curve Shapes
 *
 *     progress
 *       1.0 ┤                 ╭──────      every curve satisfies
 *           │              ╭──╯             f(0) = 0 and f(1) = 1
 *           │          ╭───╯
 *           │      ╭───╯                    back/elastic/organic may
 *           │  ╭───╯                        leave [0, 1] in between
 *       0.0 ┼──╯
 *           └──────────────────────── t
 *           0.0                     1.0
 *
 * @section Overshoot Overshoot
 *
 * When 0.3 < t < 0.8 an overshoot term is added:
 *
 *     overshoot * (end - start) * sin((t - 0.3) * pi / 0.5)
 *
 * The term peaks at t = 0.55 and vanishes at both window edges, so the
 * final position is unaffected.
 *
 * @license MIT
 */

#ifndef MOTION_INTERPOLATOR_HPP
#define MOTION_INTERPOLATOR_HPP

#include "MotionTypes.hpp"

namespace motion {

/**
 * @brief Apply an easing curve to normalized time
 * @param t Normalized time, clamped to [0, 1]
 * @return Eased progress; exactly 0 at t=0 and exactly 1 at t=1
 */
double ease(double t, Easing easing);

/**
 * @brief Position at normalized time t between start and end
 *
 * @param t Normalized time in [0, 1]
 * @param start Position at t = 0
 * @param end Position at t = 1
 * @param easing Curve to apply
 * @param overshoot Overshoot fraction (>= 0), 0 disables
 */
double interpolate(double t, double start, double end, Easing easing, double overshoot = 0.0);

/**
 * @brief Round and clamp a position into the absolute hardware range
 *
 * Last step before a value reaches the driver.
 */
int clampToLimits(double position, const ActuatorLimits& limits);

} // namespace motion

#endif // MOTION_INTERPOLATOR_HPP
