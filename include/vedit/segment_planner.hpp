/**
 * @file segment_planner.hpp
 * @brief Decomposes speed-ramped clips into constant-speed source ranges
 *
 * @details The external encoder renders one constant speed per invocation.
 *          A clip with a speed curve is therefore cut into sub-chunks of at
 *          most chunk_sec clip-local seconds; each sub-chunk renders at the
 *          average of its start and end instantaneous speeds.
 *
 *          Because the speed curve is linear inside a keyframe span, that
 *          average times the chunk length equals the exact integral, so the
 *          planned source ranges tile [in_point, in_point + source_time_of()]
 *          without drift. The residual approximation is inside each chunk
 *          (constant instead of ramped playback), bounded by chunk_sec.
 *
 * @attention SOURCE EXHAUSTION:
 *
 *   - Every chunk's source end is clamped to the asset duration
 *
 *   - Once the source cursor reaches the asset end, planning of that clip
 *     stops; the uncovered remainder is filled according to the
 *     ExhaustionPolicy (hold last frame, black, or nothing)
 */

#ifndef VEDIT_SEGMENT_PLANNER_HPP
#define VEDIT_SEGMENT_PLANNER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace vedit {

/**
 * @brief What renders in the timeline gap left by an exhausted source.
 */
enum class ExhaustionPolicy {
  HoldLastFrame, //< Still of the last source frame, silent audio
  Black,         //< Black frame, silent audio
  Truncate       //< Nothing; the clip ends early in the export
};

/// Parse "hold" / "black" / "truncate"; unknown strings map to HoldLastFrame
ExhaustionPolicy parse_exhaustion_policy(const std::string &name);

const char *to_string(ExhaustionPolicy policy);

/// How a planned segment is rendered
enum class SegmentKind {
  Ranged, //< Source range played at constant speed
  Hold,   //< Single still frame looped for the segment duration
  Filler  //< Exhaustion gap, rendered per ExhaustionPolicy
};

/**
 * @struct PlannedSegment
 * @brief One constant-speed render unit.
 */
struct PlannedSegment {
  double source_start = 0.0;      //< Asset seconds
  double source_end = 0.0;        //< Asset seconds
  double speed = 1.0;             //< Constant render speed
  double timeline_start = 0.0;    //< Timeline seconds
  double timeline_duration = 0.0; //< Timeline seconds the render must fill
  SegmentKind kind = SegmentKind::Ranged;

  bool hold() const { return kind == SegmentKind::Hold; }
  double source_duration() const { return source_end - source_start; }
};

/**
 * @struct PlannerOptions
 */
struct PlannerOptions {
  double chunk_sec = 0.5;      //< Max clip-local length of one sub-chunk
  double hold_epsilon = 0.01;  //< Average speed treated as a hold
  double min_span_sec = 0.001; //< Keyframe spans shorter than this are skipped
  double unknown_source_duration = 10000.0; //< Clamp when duration unknown
  ExhaustionPolicy exhaustion = ExhaustionPolicy::HoldLastFrame;
};

/**
 * @struct ClipPlan
 * @brief Planned segments of one clip, in timeline order.
 */
struct ClipPlan {
  const Clip *clip = nullptr;
  const AssetInfo *asset = nullptr;
  std::vector<PlannedSegment> segments;
  bool source_exhausted = false;
  double exhausted_at = 0.0; //< Clip-local time the source ran out

  /// Source seconds consumed by all Ranged and Hold segments
  double planned_source() const;
};

/**
 * @brief Plan one clip.
 *
 * @param clip Clip with 0..N speed keyframes
 * @param asset Asset metadata used to clamp source ranges
 * @param options Chunking, hold detection and exhaustion policy
 */
ClipPlan plan_clip(const Clip &clip, const AssetInfo &asset,
                   const PlannerOptions &options);

/**
 * @struct RenderSegment
 * @brief A planned segment tagged with its owner for the render phase.
 */
struct RenderSegment {
  PlannedSegment segment;
  const Clip *clip = nullptr;
  const AssetInfo *asset = nullptr;
  TrackKind track = TrackKind::VideoA;
  std::size_t clip_index = 0;    //< Position of the clip in render order
  std::size_t segment_index = 0; //< Position inside the clip
};

/**
 * @brief Plan every clip of both video tracks.
 *
 * @return Segments ordered by timeline start; at equal start the VideoB
 *         segment comes first. Clips without a known asset are skipped.
 */
std::vector<RenderSegment> plan_video_tracks(const Project &project,
                                             const PlannerOptions &options);

} // namespace vedit

#endif // VEDIT_SEGMENT_PLANNER_HPP
