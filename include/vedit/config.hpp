/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values are read once per process; hosts that need different
 *          settings per job build a RenderSettings explicitly instead.
 */

#ifndef VEDIT_CONFIG_HPP
#define VEDIT_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace vedit {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- EXTERNAL ENCODER ----**

/// Encoder binary; resolved through PATH when not absolute
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/**
 * @brief Wall-clock limit for a single encoder invocation in seconds
 * @note 0 disables the limit.
 */
inline double encoder_timeout_sec() {
  static double val = get_env_double("ENCODER_TIMEOUT_SEC", 0.0);
  return val;
}

// **---- STORAGE ----**

/**
 * @brief Storage root
 * @note Holds exports/ (finished files), temp/<job-id>/ (scratch areas) and
 *       jobs.json (job ledger).
 */
inline const std::string &storage_path() {
  static std::string val = get_env_string("STORAGE_PATH", "./storage");
  return val;
}

// **---- SEGMENT PLANNING ----**

/**
 * @brief Maximum clip-local length of one planned sub-chunk
 * @note Smaller chunks track fast speed ramps more closely at the cost of
 *       more encoder invocations.
 */
inline double segment_chunk_sec() {
  static double val = get_env_double("SEGMENT_CHUNK_SEC", 0.5);
  return val;
}

/// Average speed below which a segment is rendered as a still-frame hold
inline double hold_speed_epsilon() {
  static double val = get_env_double("HOLD_SPEED_EPSILON", 0.01);
  return val;
}

/**
 * @brief What fills the timeline once a clip runs out of source
 * @note One of "hold", "black" or "truncate".
 */
inline const std::string &exhaustion_policy() {
  static std::string val = get_env_string("EXHAUSTION_POLICY", "hold");
  return val;
}

// **---- RENDER FORMAT ----**

/// Frame rate used when an asset has no probed fps
inline double default_fps() {
  static double val = get_env_double("DEFAULT_FPS", 30.0);
  return val;
}

/// Sample rate of the intermediate (stereo, pcm_s16le) audio stream
inline int audio_sample_rate() {
  static int val = get_env_int("AUDIO_SAMPLE_RATE", 44100);
  return val;
}

/// Placeholder canvas width for timelines without video clips
inline int canvas_width() {
  static int val = get_env_int("CANVAS_WIDTH", 1280);
  return val;
}

/// Placeholder canvas height for timelines without video clips
inline int canvas_height() {
  static int val = get_env_int("CANVAS_HEIGHT", 720);
  return val;
}

/// Font file handed to drawtext for text overlays
inline const std::string &overlay_font() {
  static std::string val = get_env_string(
      "OVERLAY_FONT", "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of segment renders a single job runs concurrently
 * @note 1 keeps the sequential behavior (segment N+1 starts after N).
 *       0 = auto-detect from the CPU limit.
 */
inline int segment_workers() {
  static int val = get_env_int("SEGMENT_WORKERS", 1);
  return val;
}

/// Number of export jobs processed concurrently by the export service
inline int export_workers() {
  static int val = get_env_int("EXPORT_WORKERS", 2);
  return val;
}

} // namespace Config
} // namespace vedit

#endif // VEDIT_CONFIG_HPP
