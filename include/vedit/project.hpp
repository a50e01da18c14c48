/**
 * @file project.hpp
 * @brief Project snapshot construction and validation
 *
 * @details The time engine and the export pipeline only read projects.
 *          These helpers are used at the boundary where a snapshot is
 *          assembled (project_io, tests, hosts):
 *
 *          - make_project: empty project with one track per kind
 *
 *          - normalize_project: orders clips and keyframes by time
 *
 *          - validate_project: rejects data no safe default can repair
 */

#ifndef VEDIT_PROJECT_HPP
#define VEDIT_PROJECT_HPP

#include <string>

#include "types.hpp"

namespace vedit {

/**
 * @brief Create an empty project holding exactly one track per TrackKind.
 * @param id Project ID
 * @param name Display name
 */
Project make_project(const std::string &id, const std::string &name = {});

/**
 * @brief Sort clips by start time and keyframes by time, add missing tracks.
 * @note Sorting is stable, so clips sharing a start keep their input order.
 */
void normalize_project(Project &project);

/**
 * @brief Check a normalized project for data that cannot be rendered.
 *
 * @throws ValidationError naming the first offending clip when:
 *         - a track kind appears more than once
 *         - a clip has start_time < 0 or duration <= 0
 *         - a speed keyframe has negative time or speed
 *         - two keyframes of one clip share a time
 *         - an overlay keyframe has opacity outside [0, 1]
 *         - keyframes are not ordered by time
 */
void validate_project(const Project &project);

const char *to_string(TrackKind kind);

} // namespace vedit

#endif // VEDIT_PROJECT_HPP
