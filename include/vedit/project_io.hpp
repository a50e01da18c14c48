/**
 * @file project_io.hpp
 * @brief JSON wire boundary for project snapshots and job records
 *
 * @details The only place where wire names are translated:
 *
 *          - keyframe fields are snake_case (scale_x); camelCase aliases
 *            (scaleX, speedKeyframes, fontSize) are accepted on input
 *
 *          - clip properties may arrive as an object or as a JSON string
 *
 *          - track types are VIDEO_A, VIDEO_B, OVERLAY_TEXT, OVERLAY_IMAGE,
 *            AUDIO; job statuses QUEUED, RUNNING, COMPLETE, FAILED
 */

#ifndef VEDIT_PROJECT_IO_HPP
#define VEDIT_PROJECT_IO_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "timeline_evaluator.hpp"
#include "types.hpp"

namespace vedit {

// **---- Projects ----**

/**
 * @brief Build a normalized, validated project from its JSON form.
 * @throws ValidationError on malformed documents or invalid clip data
 */
Project parse_project(const nlohmann::json &doc);

/// parse_project() of a JSON text
Project parse_project_text(const std::string &text);

/// parse_project() of a JSON file
Project load_project(const std::string &path);

/// Canonical JSON form (snake_case, properties as an object)
nlohmann::json project_to_json(const Project &project);

// **---- Enumerations ----**

/// Throws ValidationError for unknown names
TrackKind parse_track_kind(const std::string &name);

/// Unknown or empty names map to Linear
Easing parse_easing(const std::string &name);

const char *to_string(Easing easing);

const char *to_string(JobStatus status);

/// Throws ValidationError for unknown names
JobStatus parse_job_status(const std::string &name);

// **---- Job records ----**

nlohmann::json job_to_json(const ExportJob &job);

ExportJob job_from_json(const nlohmann::json &doc);

// **---- Evaluation results ----**

/// Preview-driver form of evaluate_at() output
nlohmann::json active_layers_to_json(const ActiveLayers &layers);

} // namespace vedit

#endif // VEDIT_PROJECT_IO_HPP
