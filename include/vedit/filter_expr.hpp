/**
 * @file filter_expr.hpp
 * @brief Generation of encoder-native time-varying expressions
 *
 * @details Overlay animation is evaluated per output frame by the encoder,
 *          not precomputed. anim_expr() turns a keyframe list into a nested
 *          conditional chain
 *
 *              if(lte(T,k0), v0, if(lte(T,k1), lerp01, if(..., vN)))
 *
 *          with T = (t - clip_start), applying the same eased linear
 *          interpolation as interpolate_overlay(). Commas are escaped (\,)
 *          because the expressions are embedded in filter-graph scripts.
 *
 * @note Only strings are produced here; nothing in this module runs the
 *       encoder, so the keyframe math stays testable on its own.
 */

#ifndef VEDIT_FILTER_EXPR_HPP
#define VEDIT_FILTER_EXPR_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace vedit {

/**
 * @brief Format a number for encoder arguments and expressions.
 * @note Fixed notation (no exponent), trailing zeros trimmed: 2.50 -> "2.5".
 */
std::string format_number(double value);

/// format_number(), with negative values wrapped in parentheses
std::string expr_number(double value);

/**
 * @brief Eased version of a normalized-fraction expression.
 * @param fraction Expression evaluating to [0, 1]
 * @param easing Curve to apply (same curves as eased_progress())
 */
std::string eased_fraction_expr(const std::string &fraction, Easing easing);

/**
 * @brief Time-varying expression for one overlay field.
 *
 * @param keyframes Overlay keyframes ordered by time
 * @param field Field to animate (e.g. &OverlayKeyframe::x)
 * @param default_expr Expression used when there are no keyframes
 * @param clip_start Timeline start of the clip (keyframes are clip-local)
 */
std::string anim_expr(const std::vector<OverlayKeyframe> &keyframes,
                      double OverlayKeyframe::*field,
                      const std::string &default_expr, double clip_start);

/// Escape user text for drawtext's text='...' option
std::string escape_drawtext(const std::string &text);

/// "#rrggbb" -> "0xrrggbb"; empty -> "white"; names pass through
std::string ffmpeg_color(const std::string &color);

} // namespace vedit

#endif // VEDIT_FILTER_EXPR_HPP
