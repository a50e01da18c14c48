/**
 * @file media_probe.hpp
 * @brief Container and stream metadata probing via libavformat
 *
 * @details Used by the render orchestrator to fill asset metadata the
 *          project snapshot did not carry (duration, frame rate, audio
 *          presence) before segment planning clamps against it.
 */

#ifndef VEDIT_MEDIA_PROBE_HPP
#define VEDIT_MEDIA_PROBE_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace vedit {

/**
 * @struct MediaInfo
 * @brief Probed container and stream properties.
 * @note duration and fps are 0 when the container does not report them.
 */
struct MediaInfo {
  double duration = 0.0;
  double fps = 0.0;
  bool has_video = false;
  bool has_audio = false;
  int width = 0;
  int height = 0;
};

/**
 * @brief Open a media file and read its stream layout.
 * @return std::nullopt if the file cannot be opened or parsed
 */
std::optional<MediaInfo> probe_media(const std::string &path);

/**
 * @brief Fill unknown duration, fps and audio presence of an asset.
 *
 * @details Probes only when something is missing. Fields the snapshot
 *          already carries are never overwritten.
 *
 * @return false if probing was needed and failed (asset left unchanged)
 */
bool complete_asset_metadata(AssetInfo &asset);

} // namespace vedit

#endif // VEDIT_MEDIA_PROBE_HPP
