/**
 * @file segment_planner.cpp
 * @brief Segment planning implementation
 *
 * @details Walks consecutive speed keyframe pairs, splits each span into
 *          chunks of at most chunk_sec, and advances a source cursor by the
 *          exact integral of every chunk. The cursor never moves backwards.
 */

#include "vedit/segment_planner.hpp"

#include <algorithm>
#include <cmath>

#include "vedit/keyframe_math.hpp"
#include "vedit/logging.hpp"

namespace vedit {

// **---- Policy Names ----**

ExhaustionPolicy parse_exhaustion_policy(const std::string &name) {
  if (name == "black")
    return ExhaustionPolicy::Black;
  if (name == "truncate")
    return ExhaustionPolicy::Truncate;
  return ExhaustionPolicy::HoldLastFrame;
}

const char *to_string(ExhaustionPolicy policy) {
  switch (policy) {
  case ExhaustionPolicy::HoldLastFrame:
    return "hold";
  case ExhaustionPolicy::Black:
    return "black";
  case ExhaustionPolicy::Truncate:
    return "truncate";
  }
  return "hold";
}

double ClipPlan::planned_source() const {
  double total = 0.0;
  for (const auto &s : segments) {
    if (s.kind != SegmentKind::Filler)
      total += s.source_duration();
  }
  return total;
}

// **---- Single Clip ----**

namespace {

/**
 * @class ChunkEmitter
 * @brief Appends chunks to a plan while tracking the source cursor.
 */
class ChunkEmitter {
public:
  ChunkEmitter(ClipPlan &plan, const PlannerOptions &options,
               double max_source)
      : plan_(plan), options_(options), max_source_(max_source),
        cursor_(plan.clip->in_point) {}

  /**
   * @brief Emit one constant-speed chunk.
   * @param local_start Clip-local start of the chunk
   * @param local_len Clip-local length of the chunk
   * @param speed Average speed over the chunk
   * @return false once the source is exhausted (stop planning)
   */
  bool emit(double local_start, double local_len, double speed) {
    if (cursor_ >= max_source_) {
      stopped_at_ = local_start;
      return false;
    }

    PlannedSegment seg;
    seg.timeline_start = plan_.clip->start_time + local_start;
    seg.speed = speed;

    if (speed < options_.hold_epsilon) {
      seg.kind = SegmentKind::Hold;
      seg.source_start = cursor_;
      /// Near-zero speeds still consume a sliver of source
      seg.source_end = std::min(cursor_ + local_len * speed, max_source_);
      seg.timeline_duration = local_len;
      plan_.segments.push_back(seg);
      cursor_ = seg.source_end;
      return true;
    }

    double wanted = local_len * speed;
    double end = std::min(cursor_ + wanted, max_source_);
    bool clamped = end < cursor_ + wanted;

    seg.kind = SegmentKind::Ranged;
    seg.source_start = cursor_;
    seg.source_end = end;
    seg.timeline_duration = clamped ? (end - cursor_) / speed : local_len;
    plan_.segments.push_back(seg);

    cursor_ = clamped ? end : cursor_ + wanted;
    if (cursor_ >= max_source_) {
      stopped_at_ = local_start + seg.timeline_duration;
      return false;
    }
    return true;
  }

  double cursor() const { return cursor_; }
  double stopped_at() const { return stopped_at_; }

private:
  ClipPlan &plan_;
  const PlannerOptions &options_;
  double max_source_;
  double cursor_;
  double stopped_at_ = -1.0;
};

} // anonymous namespace

ClipPlan plan_clip(const Clip &clip, const AssetInfo &asset,
                   const PlannerOptions &options) {
  ClipPlan plan;
  plan.clip = &clip;
  plan.asset = &asset;

  double max_source =
      asset.duration > 0.0 ? asset.duration : options.unknown_source_duration;
  ChunkEmitter emitter(plan, options, max_source);

  std::vector<SpeedKeyframe> kfs = clip.speed_keyframes;
  std::stable_sort(kfs.begin(), kfs.end(),
                   [](const SpeedKeyframe &a, const SpeedKeyframe &b) {
                     return a.time < b.time;
                   });

  if (kfs.size() <= 1) {
    double speed = kfs.empty() ? 1.0 : kfs.front().speed;
    emitter.emit(0.0, clip.duration, speed);
  } else {
    double chunk = options.chunk_sec > 0.0 ? options.chunk_sec : 0.5;
    double prev_time = 0.0;
    bool running = true;

    for (std::size_t ki = 0; ki <= kfs.size() && running; ++ki) {
      double kf_time = ki < kfs.size() ? kfs[ki].time : clip.duration;
      /// A keyframe past the clip end only shapes the curve up to the end
      bool past_end = kf_time >= clip.duration;
      kf_time = std::min(kf_time, clip.duration);

      double span = kf_time - prev_time;
      if (span <= options.min_span_sec) {
        if (past_end)
          break;
        continue;
      }

      double start_speed = speed_at(prev_time, kfs);
      double end_speed = speed_at(kf_time, kfs);

      int steps = static_cast<int>(std::ceil(span / chunk));
      double step_dur = span / steps;

      for (int s = 0; s < steps; ++s) {
        double s0 = lerp(start_speed, end_speed,
                         static_cast<double>(s) / steps);
        double s1 = lerp(start_speed, end_speed,
                         static_cast<double>(s + 1) / steps);
        double local_start = prev_time + s * step_dur;
        if (!emitter.emit(local_start, step_dur, (s0 + s1) / 2.0)) {
          running = false;
          break;
        }
      }
      prev_time = kf_time;
      if (past_end)
        break;
    }
  }

  /// Source ran out before the clip ends: fill or truncate the remainder
  double stopped = emitter.stopped_at();
  if (stopped >= 0.0 && stopped < clip.duration - options.min_span_sec) {
    plan.source_exhausted = true;
    plan.exhausted_at = stopped;

    if (options.exhaustion != ExhaustionPolicy::Truncate) {
      PlannedSegment fill;
      fill.kind = SegmentKind::Filler;
      fill.source_start = std::min(emitter.cursor(), max_source);
      fill.source_end = fill.source_start;
      fill.speed = 0.0;
      fill.timeline_start = clip.start_time + stopped;
      fill.timeline_duration = clip.duration - stopped;
      plan.segments.push_back(fill);
    }
  }

  return plan;
}

// **---- Whole Project ----**

std::vector<RenderSegment> plan_video_tracks(const Project &project,
                                             const PlannerOptions &options) {
  struct Entry {
    const Clip *clip;
    TrackKind track;
  };

  std::vector<Entry> clips;
  for (TrackKind kind : {TrackKind::VideoA, TrackKind::VideoB}) {
    const Track *t = project.track(kind);
    if (!t)
      continue;
    for (const auto &c : t->clips)
      clips.push_back({&c, kind});
  }

  /// Secondary layer first at equal start
  auto before = [](double a_start, TrackKind a_track, double b_start,
                   TrackKind b_track) {
    if (a_start != b_start)
      return a_start < b_start;
    return a_track == TrackKind::VideoB && b_track != TrackKind::VideoB;
  };

  std::stable_sort(clips.begin(), clips.end(),
                   [&](const Entry &a, const Entry &b) {
                     return before(a.clip->start_time, a.track,
                                   b.clip->start_time, b.track);
                   });

  std::vector<RenderSegment> out;
  for (std::size_t ci = 0; ci < clips.size(); ++ci) {
    const Clip &clip = *clips[ci].clip;
    const AssetInfo *asset = project.find_asset(clip.asset_id);
    if (!asset) {
      LOG_WARN("Clip '{}' has no known asset, skipping", clip.id);
      continue;
    }

    ClipPlan plan = plan_clip(clip, *asset, options);
    if (plan.source_exhausted) {
      LOG_WARN("Clip '{}' exhausts its source at {:.3f}s of {:.3f}s ({})",
               clip.id, plan.exhausted_at, clip.duration,
               to_string(options.exhaustion));
    }

    for (std::size_t si = 0; si < plan.segments.size(); ++si) {
      RenderSegment rs;
      rs.segment = plan.segments[si];
      rs.clip = &clip;
      rs.asset = asset;
      rs.track = clips[ci].track;
      rs.clip_index = ci;
      rs.segment_index = si;
      out.push_back(rs);
    }
  }

  std::stable_sort(out.begin(), out.end(),
                   [&](const RenderSegment &a, const RenderSegment &b) {
                     return before(a.segment.timeline_start, a.track,
                                   b.segment.timeline_start, b.track);
                   });
  return out;
}

} // namespace vedit
