/**
 * @file keyframe_math.hpp
 * @brief Speed integration and overlay keyframe interpolation
 *
 * @details Pure functions shared by the preview evaluator, the segment
 *          planner and the tests:
 *
 *          - speed_at: instantaneous speed of a piecewise-linear speed curve
 *
 *          - source_time_of: exact trapezoidal integral of that curve
 *
 *          - interpolate_overlay: eased interpolation of overlay transforms
 *
 * @note Keyframe vectors are expected ordered by time (normalize_project
 *       guarantees it for loaded snapshots). Unordered input is sorted into a
 *       local copy first. All functions are reentrant.
 */

#ifndef VEDIT_KEYFRAME_MATH_HPP
#define VEDIT_KEYFRAME_MATH_HPP

#include <vector>

#include "types.hpp"

namespace vedit {

/**
 * @struct OverlayTransform
 * @brief Resolved overlay placement at one instant.
 */
struct OverlayTransform {
  double x = 0.0;
  double y = 0.0;
  double scale_x = 1.0;
  double scale_y = 1.0;
  double rotation = 0.0; //< Degrees
  double opacity = 1.0;
};

/**
 * @brief Linear interpolation, exact at both ends (t = 0 gives a, t = 1 b).
 */
inline double lerp(double a, double b, double t) {
  return (1.0 - t) * a + t * b;
}

/**
 * @brief Apply an easing curve to a normalized fraction in [0, 1].
 *
 * @note easeIn = t^2, easeOut = t(2 - t), easeInOut = quadratic split at
 *       t = 0.5, linear = identity.
 */
double eased_progress(double t, Easing easing);

/**
 * @brief Instantaneous speed at a clip-local time.
 * @return Linear interpolation between the bounding keyframes, the first or
 *         last keyframe's speed outside their range, 1.0 without keyframes.
 */
double speed_at(double local_time, const std::vector<SpeedKeyframe> &keyframes);

/**
 * @brief Source seconds consumed between clip start and a clip-local time.
 *
 * @details Exact piecewise-trapezoidal integral of the speed curve: every
 *          fully consumed keyframe span [t0, t1] adds (t1 - t0)(s0 + s1)/2,
 *          the final partial span adds (t - t0)(s0 + s(t))/2, time before
 *          the first keyframe runs at the first speed and time after the
 *          last keyframe runs at the last speed.
 *
 * @return local_time unchanged when there are no keyframes.
 *
 * @note Non-decreasing in local_time for non-negative speeds; hold spans
 *       (speed 0) contribute nothing.
 */
double source_time_of(double local_time,
                      const std::vector<SpeedKeyframe> &keyframes);

/**
 * @brief Overlay transform at a clip-local time.
 *
 * @details Finds the bounding keyframe pair, eases the normalized fraction
 *          with the earlier keyframe's easing and interpolates every field
 *          with the eased fraction. Clamps to the first/last keyframe outside
 *          the keyframed range.
 *
 * @return Default transform (x = y = 0, scale 1, rotation 0, opacity 1)
 *         without keyframes.
 */
OverlayTransform
interpolate_overlay(double local_time,
                    const std::vector<OverlayKeyframe> &keyframes);

/// Transform stored in a single keyframe
OverlayTransform to_transform(const OverlayKeyframe &kf);

} // namespace vedit

#endif // VEDIT_KEYFRAME_MATH_HPP
