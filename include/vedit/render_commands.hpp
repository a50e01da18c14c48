/**
 * @file render_commands.hpp
 * @brief Encoder argument vectors for every render phase
 *
 * @details The encoder's command-line and filter-graph surface is treated
 *          as a fixed protocol. This module only decides which arguments to
 *          issue; RenderOrchestrator decides when.
 *
 *          Every phase-1 intermediate shares one profile so the concat
 *          demuxer can join them without re-encoding video:
 *          libx264 / yuv420p / even dimensions / pcm_s16le stereo audio.
 */

#ifndef VEDIT_RENDER_COMMANDS_HPP
#define VEDIT_RENDER_COMMANDS_HPP

#include <string>
#include <vector>

#include "segment_planner.hpp"
#include "types.hpp"

namespace vedit {

using Args = std::vector<std::string>;

/**
 * @struct RenderFormat
 * @brief Output profile shared by all intermediates.
 */
struct RenderFormat {
  double fps = 30.0;
  int sample_rate = 44100;
  int canvas_width = 1280;
  int canvas_height = 720;
  std::string font_path;
};

// **---- Phase 1: Segments ----**

/// Extract one still frame at `seek` seconds into `frame_path`
Args still_frame_args(const std::string &asset_path, double seek,
                      const std::string &frame_path);

/**
 * @brief Loop a still for `duration` seconds with synthesized silence.
 * @param blackout Paint the frame black (keeps the source dimensions so the
 *                 result concatenates with the clip's other segments)
 */
Args hold_loop_args(const std::string &frame_path, double duration,
                    double fps, const RenderFormat &format,
                    const std::string &out, bool blackout = false);

/**
 * @brief Constant-speed render of a source range.
 *
 * @param asset_path Source media
 * @param seg Ranged segment (source range and speed)
 * @param fps Output frame rate (asset fps)
 * @param source_audio Use the source audio with a matching tempo filter;
 *                     otherwise silence of the output length is synthesized
 * @param format Shared intermediate profile
 * @param out Output path
 */
Args ranged_segment_args(const std::string &asset_path,
                         const PlannedSegment &seg, double fps,
                         bool source_audio, const RenderFormat &format,
                         const std::string &out);

/**
 * @brief atempo chain reproducing `speed` exactly.
 * @note A single atempo accepts [0.5, 100]; slower speeds chain several.
 */
std::string atempo_chain(double speed);

// **---- Phase 2: Concatenation ----**

/// Concat demuxer list ("file '<path>'" per line, quotes escaped)
std::string concat_list(const std::vector<std::string> &paths);

/// Stream-copy video, transcode audio to AAC
Args concat_args(const std::string &list_path, const std::string &out);

/// Black canvas with silence, used when no video segment exists
Args blank_canvas_args(double duration, const RenderFormat &format,
                       const std::string &out);

// **---- Phases 3 and 4: Compositing ----**

/**
 * @struct FilterGraph
 * @brief Extra inputs plus the filter-graph lines that consume them.
 * @note Input 0 is always the working artifact; `inputs` start at index 1.
 */
struct FilterGraph {
  Args inputs;
  std::vector<std::string> lines;
  std::string output_label;

  bool empty() const { return lines.empty(); }
  /// Lines joined with ";\n" (filter script form)
  std::string script() const;
  /// Lines joined with ";" (inline -filter_complex form)
  std::string inline_graph() const;
};

/**
 * @struct OverlaySource
 * @brief One overlay clip to composite.
 * @note asset is required for image overlays, ignored for text.
 */
struct OverlaySource {
  const Clip *clip = nullptr;
  TrackKind kind = TrackKind::OverlayText;
  const AssetInfo *asset = nullptr;
};

/**
 * @brief Layer every overlay clip over input 0.
 *
 * @details Image overlays are rotated, scaled and faded per frame, then
 *          overlaid at an animated position; text overlays are drawn with
 *          drawtext at an animated position and alpha. Every overlay is
 *          enabled only within [start_time, start_time + duration].
 *
 * @param overlays Clips in compositing order (bottom first)
 * @param total_duration Length of the working artifact
 * @param format Provides the font path
 */
FilterGraph overlay_graph(const std::vector<OverlaySource> &overlays,
                          double total_duration, const RenderFormat &format);

Args overlay_args(const std::string &base, const FilterGraph &graph,
                  const std::string &script_path, const std::string &out);

/**
 * @struct AudioSource
 * @brief One audio-track clip to mix.
 */
struct AudioSource {
  const Clip *clip = nullptr;
  const AssetInfo *asset = nullptr;
};

/**
 * @brief Trim, delay and scale every audio clip, then mix with input 0's
 *        audio bed (output length follows the bed).
 */
FilterGraph audio_mix_graph(const std::vector<AudioSource> &sources);

Args audio_mix_args(const std::string &base, const FilterGraph &graph,
                    const std::string &out);

} // namespace vedit

#endif // VEDIT_RENDER_COMMANDS_HPP
