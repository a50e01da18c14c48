/**
 * @file keyframe_math.cpp
 * @brief Speed integration and overlay interpolation implementation
 */

#include "vedit/keyframe_math.hpp"

#include <algorithm>

namespace vedit {

namespace {

/// Returns keyframes itself when already ordered, else a sorted copy
template <typename Keyframe>
const std::vector<Keyframe> &ordered(const std::vector<Keyframe> &keyframes,
                                     std::vector<Keyframe> &scratch) {
  auto by_time = [](const Keyframe &a, const Keyframe &b) {
    return a.time < b.time;
  };
  if (std::is_sorted(keyframes.begin(), keyframes.end(), by_time))
    return keyframes;
  scratch = keyframes;
  std::stable_sort(scratch.begin(), scratch.end(), by_time);
  return scratch;
}

} // anonymous namespace

double eased_progress(double t, Easing easing) {
  switch (easing) {
  case Easing::EaseIn:
    return t * t;
  case Easing::EaseOut:
    return t * (2.0 - t);
  case Easing::EaseInOut:
    return t < 0.5 ? 2.0 * t * t : -1.0 + (4.0 - 2.0 * t) * t;
  case Easing::Linear:
    break;
  }
  return t;
}

double speed_at(double local_time,
                const std::vector<SpeedKeyframe> &keyframes) {
  if (keyframes.empty())
    return 1.0;

  std::vector<SpeedKeyframe> scratch;
  const auto &kf = ordered(keyframes, scratch);

  if (local_time <= kf.front().time)
    return kf.front().speed;
  if (local_time >= kf.back().time)
    return kf.back().speed;

  for (std::size_t i = 0; i + 1 < kf.size(); ++i) {
    if (local_time >= kf[i].time && local_time <= kf[i + 1].time) {
      double span = kf[i + 1].time - kf[i].time;
      double t = span > 0.0 ? (local_time - kf[i].time) / span : 0.0;
      return lerp(kf[i].speed, kf[i + 1].speed, t);
    }
  }
  return kf.back().speed;
}

double source_time_of(double local_time,
                      const std::vector<SpeedKeyframe> &keyframes) {
  if (keyframes.empty())
    return local_time;

  std::vector<SpeedKeyframe> scratch;
  const auto &kf = ordered(keyframes, scratch);

  /// The span before the first keyframe runs at the first keyframe's speed
  double source = 0.0;
  double prev_time = 0.0;
  double prev_speed = kf.front().speed;

  for (const auto &k : kf) {
    if (local_time <= k.time) {
      double span = k.time - prev_time;
      double t = local_time - prev_time;
      if (span <= 0.0)
        return source + prev_speed * t;
      double speed_t = lerp(prev_speed, k.speed, t / span);
      return source + t * (prev_speed + speed_t) / 2.0;
    }
    source += (k.time - prev_time) * (prev_speed + k.speed) / 2.0;
    prev_time = k.time;
    prev_speed = k.speed;
  }

  /// Past the last keyframe: constant last speed
  return source + (local_time - prev_time) * prev_speed;
}

OverlayTransform to_transform(const OverlayKeyframe &kf) {
  OverlayTransform out;
  out.x = kf.x;
  out.y = kf.y;
  out.scale_x = kf.scale_x;
  out.scale_y = kf.scale_y;
  out.rotation = kf.rotation;
  out.opacity = kf.opacity;
  return out;
}

OverlayTransform
interpolate_overlay(double local_time,
                    const std::vector<OverlayKeyframe> &keyframes) {
  if (keyframes.empty())
    return OverlayTransform{};

  std::vector<OverlayKeyframe> scratch;
  const auto &kf = ordered(keyframes, scratch);

  if (local_time <= kf.front().time)
    return to_transform(kf.front());
  if (local_time >= kf.back().time)
    return to_transform(kf.back());

  for (std::size_t i = 0; i + 1 < kf.size(); ++i) {
    const auto &a = kf[i];
    const auto &b = kf[i + 1];
    if (local_time < a.time || local_time > b.time)
      continue;

    double span = b.time - a.time;
    double t = span > 0.0 ? (local_time - a.time) / span : 0.0;
    t = eased_progress(t, a.easing);

    OverlayTransform out;
    out.x = lerp(a.x, b.x, t);
    out.y = lerp(a.y, b.y, t);
    out.scale_x = lerp(a.scale_x, b.scale_x, t);
    out.scale_y = lerp(a.scale_y, b.scale_y, t);
    out.rotation = lerp(a.rotation, b.rotation, t);
    out.opacity = lerp(a.opacity, b.opacity, t);
    return out;
  }
  return to_transform(kf.back());
}

} // namespace vedit
