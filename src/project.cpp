/**
 * @file project.cpp
 * @brief Project snapshot helpers implementation
 */

#include "vedit/project.hpp"

#include <algorithm>
#include <array>

#include <fmt/core.h>

#include "vedit/errors.hpp"

namespace vedit {

// **---- Project Members ----**

const Track *Project::track(TrackKind kind) const {
  for (const auto &t : tracks) {
    if (t.kind == kind)
      return &t;
  }
  return nullptr;
}

Track *Project::track(TrackKind kind) {
  for (auto &t : tracks) {
    if (t.kind == kind)
      return &t;
  }
  return nullptr;
}

const AssetInfo *
Project::find_asset(const std::optional<std::string> &asset_id) const {
  if (!asset_id)
    return nullptr;
  auto it = assets.find(*asset_id);
  return it != assets.end() ? &it->second : nullptr;
}

double Project::total_duration() const {
  double total = 0.0;
  for (const auto &t : tracks) {
    for (const auto &c : t.clips)
      total = std::max(total, c.end_time());
  }
  return total;
}

// **---- Construction ----**

const char *to_string(TrackKind kind) {
  switch (kind) {
  case TrackKind::VideoA:
    return "VIDEO_A";
  case TrackKind::VideoB:
    return "VIDEO_B";
  case TrackKind::OverlayText:
    return "OVERLAY_TEXT";
  case TrackKind::OverlayImage:
    return "OVERLAY_IMAGE";
  case TrackKind::Audio:
    return "AUDIO";
  }
  return "UNKNOWN";
}

Project make_project(const std::string &id, const std::string &name) {
  Project project;
  project.id = id;
  project.name = name;
  int order = 0;
  for (TrackKind kind : ALL_TRACK_KINDS) {
    Track t;
    t.id = fmt::format("{}:{}", id, to_string(kind));
    t.kind = kind;
    t.order = order++;
    project.tracks.push_back(std::move(t));
  }
  return project;
}

void normalize_project(Project &project) {
  int order = static_cast<int>(project.tracks.size());
  for (TrackKind kind : ALL_TRACK_KINDS) {
    if (project.track(kind))
      continue;
    Track t;
    t.id = fmt::format("{}:{}", project.id, to_string(kind));
    t.kind = kind;
    t.order = order++;
    project.tracks.push_back(std::move(t));
  }

  std::stable_sort(
      project.tracks.begin(), project.tracks.end(),
      [](const Track &a, const Track &b) { return a.order < b.order; });

  for (auto &t : project.tracks) {
    std::stable_sort(t.clips.begin(), t.clips.end(),
                     [](const Clip &a, const Clip &b) {
                       return a.start_time < b.start_time;
                     });
    for (auto &c : t.clips) {
      std::stable_sort(c.speed_keyframes.begin(), c.speed_keyframes.end(),
                       [](const SpeedKeyframe &a, const SpeedKeyframe &b) {
                         return a.time < b.time;
                       });
      std::stable_sort(c.overlay_keyframes.begin(), c.overlay_keyframes.end(),
                       [](const OverlayKeyframe &a, const OverlayKeyframe &b) {
                         return a.time < b.time;
                       });
    }
  }
}

// **---- Validation ----**

namespace {

void reject(const Clip &clip, const std::string &what) {
  throw ValidationError(fmt::format("clip '{}': {}", clip.id, what));
}

void validate_clip(const Clip &clip) {
  if (clip.start_time < 0.0)
    reject(clip, fmt::format("start_time {} is negative", clip.start_time));
  if (!(clip.duration > 0.0))
    reject(clip, fmt::format("duration {} must be positive", clip.duration));
  if (clip.in_point < 0.0)
    reject(clip, fmt::format("in_point {} is negative", clip.in_point));

  for (std::size_t i = 0; i < clip.speed_keyframes.size(); ++i) {
    const auto &kf = clip.speed_keyframes[i];
    if (kf.time < 0.0)
      reject(clip, fmt::format("speed keyframe at {} has negative time",
                               kf.time));
    if (kf.speed < 0.0)
      reject(clip, fmt::format("speed keyframe at {} has negative speed {}",
                               kf.time, kf.speed));
    if (i > 0) {
      double prev = clip.speed_keyframes[i - 1].time;
      if (kf.time < prev)
        reject(clip, "speed keyframes are not ordered by time");
      if (kf.time == prev)
        reject(clip, fmt::format("duplicate speed keyframe time {}", kf.time));
    }
  }

  for (std::size_t i = 0; i < clip.overlay_keyframes.size(); ++i) {
    const auto &kf = clip.overlay_keyframes[i];
    if (kf.opacity < 0.0 || kf.opacity > 1.0)
      reject(clip, fmt::format("overlay keyframe at {} has opacity {} "
                               "outside [0, 1]",
                               kf.time, kf.opacity));
    if (i > 0) {
      double prev = clip.overlay_keyframes[i - 1].time;
      if (kf.time < prev)
        reject(clip, "overlay keyframes are not ordered by time");
      if (kf.time == prev)
        reject(clip,
               fmt::format("duplicate overlay keyframe time {}", kf.time));
    }
  }
}

} // anonymous namespace

void validate_project(const Project &project) {
  std::array<int, TRACK_KIND_COUNT> seen{};
  for (const auto &t : project.tracks) {
    if (++seen[static_cast<std::size_t>(t.kind)] > 1)
      throw ValidationError(fmt::format("project '{}' has more than one {} "
                                        "track",
                                        project.id, to_string(t.kind)));
    for (const auto &c : t.clips)
      validate_clip(c);
  }
}

} // namespace vedit
