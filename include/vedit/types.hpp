/**
 * @file types.hpp
 * @brief Core data types for the timeline model and export jobs
 *
 * @details Contains fundamental data structures used throughout the
 * library:
 *          - Track kinds and easing curves
 *
 *          - Speed and overlay keyframes
 *
 *          - Clip, Track, AssetInfo and Project (the immutable snapshot the
 *            time engine and the export pipeline read)
 *
 *          - ExportJob records
 *
 * @note Field names are canonical snake_case everywhere in memory. Wire
 *       aliases (scaleX, speedKeyframes, ...) are translated in project_io.
 */

#ifndef VEDIT_TYPES_HPP
#define VEDIT_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vedit {

// **----- ENUMERATIONS -----**

/**
 * @brief The fixed set of tracks every project carries.
 * @note VideoA renders under VideoB; both overlay kinds render above video.
 */
enum class TrackKind { VideoA, VideoB, OverlayText, OverlayImage, Audio };

constexpr std::size_t TRACK_KIND_COUNT = 5;

/// All track kinds in compositing order (bottom layer first)
constexpr std::array<TrackKind, TRACK_KIND_COUNT> ALL_TRACK_KINDS = {
    TrackKind::VideoA, TrackKind::VideoB, TrackKind::OverlayText,
    TrackKind::OverlayImage, TrackKind::Audio};

inline bool is_video_kind(TrackKind kind) {
  return kind == TrackKind::VideoA || kind == TrackKind::VideoB;
}

inline bool is_overlay_kind(TrackKind kind) {
  return kind == TrackKind::OverlayText || kind == TrackKind::OverlayImage;
}

/// Progress curve applied to a keyframe segment's normalized fraction
enum class Easing { Linear, EaseIn, EaseOut, EaseInOut };

enum class AssetType { Video, Audio, Image };

// **----- KEYFRAMES -----**

/**
 * @struct SpeedKeyframe
 * @brief Playback speed at a clip-local time.
 * @note A speed of 0 is a valid "hold".
 */
struct SpeedKeyframe {
  double time = 0.0;  //< Seconds relative to clip start (>= 0)
  double speed = 1.0; //< Source seconds per timeline second (>= 0)
};

/**
 * @struct OverlayKeyframe
 * @brief Overlay transform sampled at a clip-local time.
 * @note The easing of keyframe i shapes the segment [i, i+1].
 */
struct OverlayKeyframe {
  double time = 0.0;
  double x = 0.0;
  double y = 0.0;
  double scale_x = 1.0;
  double scale_y = 1.0;
  double rotation = 0.0; //< Degrees
  double opacity = 1.0;  //< [0, 1]
  Easing easing = Easing::Linear;
};

// **----- TIMELINE -----**

/**
 * @struct ClipProperties
 * @brief Typed view of the free-form clip property map.
 * @note Keys without a typed field are kept verbatim in `extra`.
 */
struct ClipProperties {
  bool muted = false;
  double volume = 1.0;
  std::string text;      //< Text overlays only
  double font_size = 48; //< Text overlays only
  std::string color;     //< "#rrggbb" or a color name
  std::string font;      //< Font family, resolved by fontconfig
  std::string font_file; //< Explicit font file, wins over `font`
  std::string transition;
  std::map<std::string, std::string> extra;
};

/**
 * @struct Clip
 * @brief A placed piece of media on one track.
 * @note The clip covers the half-open timeline range
 *       [start_time, start_time + duration).
 */
struct Clip {
  std::string id;
  double start_time = 0.0; //< Timeline seconds (>= 0)
  double duration = 0.0;   //< Timeline seconds (> 0)
  double in_point = 0.0;   //< Source seconds where the trimmed range begins
  double out_point = 0.0;  //< Source seconds where the trimmed range ends
  std::optional<std::string> asset_id; //< Empty for text clips
  ClipProperties properties;
  std::vector<SpeedKeyframe> speed_keyframes;     //< Video/audio clips
  std::vector<OverlayKeyframe> overlay_keyframes; //< Overlay clips

  double end_time() const { return start_time + duration; }

  /// Half-open containment test
  bool contains(double timeline_time) const {
    return timeline_time >= start_time && timeline_time < end_time();
  }
};

/**
 * @struct Track
 * @brief Clips of one kind, ordered by start time.
 */
struct Track {
  std::string id;
  TrackKind kind = TrackKind::VideoA;
  int order = 0;
  std::vector<Clip> clips;
};

/**
 * @struct AssetInfo
 * @brief Probed metadata of a media asset.
 * @note duration <= 0 and fps <= 0 mean "unknown"; has_audio is empty when
 *       the stream layout has not been probed yet.
 */
struct AssetInfo {
  std::string id;
  std::string path;
  double duration = 0.0;
  double fps = 0.0;
  std::optional<bool> has_audio;
  AssetType type = AssetType::Video;
};

/**
 * @struct Project
 * @brief Fully resolved, read-only snapshot of a project.
 * @note Holds exactly one Track per TrackKind (see make_project).
 */
struct Project {
  std::string id;
  std::string name;
  std::vector<Track> tracks;
  std::map<std::string, AssetInfo> assets;

  /// Track of the given kind, nullptr if the snapshot lacks it
  const Track *track(TrackKind kind) const;
  Track *track(TrackKind kind);

  /// Asset referenced by a clip, nullptr if unset or unknown
  const AssetInfo *find_asset(const std::optional<std::string> &asset_id) const;

  /// Latest clip end across all tracks (0 for an empty timeline)
  double total_duration() const;
};

// **----- EXPORT JOBS -----**

enum class JobStatus { Queued, Running, Complete, Failed };

inline bool is_terminal(JobStatus status) {
  return status == JobStatus::Complete || status == JobStatus::Failed;
}

/**
 * @struct ExportJob
 * @brief Persisted state of one export request.
 * @note Created once per distinct request_id. Terminal once Complete or
 *       Failed.
 */
struct ExportJob {
  std::string id;
  std::string project_id;
  std::string request_id;
  JobStatus status = JobStatus::Queued;
  double progress = 0.0; //< [0, 100]
  std::string output_path;
  std::string error;
  std::string created_at; //< ISO-8601 UTC
  std::string updated_at; //< ISO-8601 UTC
  std::uint64_t sequence = 0; //< Creation order, newest has the largest
};

} // namespace vedit

#endif // VEDIT_TYPES_HPP
