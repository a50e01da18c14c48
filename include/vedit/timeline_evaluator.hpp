/**
 * @file timeline_evaluator.hpp
 * @brief Resolves what is visible and audible at a timeline instant
 *
 * @details evaluate_at() is called by the preview driver once per displayed
 *          frame. For every clip whose half-open extent
 *          [start_time, start_time + duration) contains the query time it
 *          computes:
 *
 *          - video/audio clips: the source time in_point + source_time_of()
 *
 *          - overlay clips: the interpolated overlay transform
 *
 * @attention THREAD MODEL:
 *            - Pure function of (project, time, options). The result holds
 *              pointers into the project, valid while the snapshot lives.
 */

#ifndef VEDIT_TIMELINE_EVALUATOR_HPP
#define VEDIT_TIMELINE_EVALUATOR_HPP

#include <optional>
#include <vector>

#include "keyframe_math.hpp"
#include "types.hpp"

namespace vedit {

/**
 * @brief How a video layer resolves clips that overlap on its own track.
 */
enum class VideoOverlapPolicy {
  LastStartWins, //< Latest start_time wins, ties go to the later clip
  FirstStartWins //< Earliest start_time wins, ties go to the earlier clip
};

/**
 * @struct EvaluatorOptions
 * @note Overlay and audio tracks always composite every active clip.
 */
struct EvaluatorOptions {
  VideoOverlapPolicy video_overlap = VideoOverlapPolicy::LastStartWins;
};

/**
 * @struct MediaLayer
 * @brief An active video or audio clip.
 */
struct MediaLayer {
  const Clip *clip = nullptr;
  const AssetInfo *asset = nullptr; //< nullptr when the asset is unknown
  double local_time = 0.0;          //< Seconds since clip start
  double source_time = 0.0;         //< Seconds into the asset
};

/**
 * @struct OverlayLayer
 * @brief An active text or image overlay.
 */
struct OverlayLayer {
  const Clip *clip = nullptr;
  const AssetInfo *asset = nullptr; //< nullptr for text overlays
  double local_time = 0.0;
  OverlayTransform transform;
};

/**
 * @struct ActiveLayers
 * @brief Everything active at one timeline instant, per track kind.
 */
struct ActiveLayers {
  std::optional<MediaLayer> video_a;      //< Bottom video layer
  std::optional<MediaLayer> video_b;      //< Video layer composited over A
  std::vector<OverlayLayer> overlay_texts;
  std::vector<OverlayLayer> overlay_images;
  std::vector<MediaLayer> audio;

  bool empty() const {
    return !video_a && !video_b && overlay_texts.empty() &&
           overlay_images.empty() && audio.empty();
  }
};

/**
 * @brief Evaluate the timeline at a given time.
 *
 * @param project Immutable project snapshot
 * @param time Timeline seconds
 * @param options Overlap policy
 * @return Active layers; empty outside the union of all clip extents
 */
ActiveLayers evaluate_at(const Project &project, double time,
                         const EvaluatorOptions &options = {});

} // namespace vedit

#endif // VEDIT_TIMELINE_EVALUATOR_HPP
