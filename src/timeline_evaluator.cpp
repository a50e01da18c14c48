/**
 * @file timeline_evaluator.cpp
 * @brief Timeline evaluation implementation
 */

#include "vedit/timeline_evaluator.hpp"

namespace vedit {

namespace {

MediaLayer media_layer(const Project &project, const Clip &clip,
                       double time) {
  MediaLayer layer;
  layer.clip = &clip;
  layer.asset = project.find_asset(clip.asset_id);
  layer.local_time = time - clip.start_time;
  layer.source_time =
      clip.in_point + source_time_of(layer.local_time, clip.speed_keyframes);
  return layer;
}

/// Whether candidate replaces current under the video overlap policy
bool replaces(const Clip &current, const Clip &candidate,
              VideoOverlapPolicy policy) {
  if (policy == VideoOverlapPolicy::FirstStartWins)
    return candidate.start_time < current.start_time;
  /// Clips are visited in track order, so >= hands ties to the later clip
  return candidate.start_time >= current.start_time;
}

} // anonymous namespace

ActiveLayers evaluate_at(const Project &project, double time,
                         const EvaluatorOptions &options) {
  ActiveLayers result;

  for (const auto &track : project.tracks) {
    for (const auto &clip : track.clips) {
      if (!clip.contains(time))
        continue;

      switch (track.kind) {
      case TrackKind::VideoA:
      case TrackKind::VideoB: {
        auto &slot =
            track.kind == TrackKind::VideoA ? result.video_a : result.video_b;
        if (!slot || replaces(*slot->clip, clip, options.video_overlap))
          slot = media_layer(project, clip, time);
        break;
      }
      case TrackKind::OverlayText:
      case TrackKind::OverlayImage: {
        OverlayLayer layer;
        layer.clip = &clip;
        layer.asset = project.find_asset(clip.asset_id);
        layer.local_time = time - clip.start_time;
        layer.transform =
            interpolate_overlay(layer.local_time, clip.overlay_keyframes);
        if (track.kind == TrackKind::OverlayText)
          result.overlay_texts.push_back(layer);
        else
          result.overlay_images.push_back(layer);
        break;
      }
      case TrackKind::Audio:
        result.audio.push_back(media_layer(project, clip, time));
        break;
      }
    }
  }
  return result;
}

} // namespace vedit
