/**
 * @file filter_expr.cpp
 * @brief Encoder expression generation implementation
 */

#include "vedit/filter_expr.hpp"

#include <cmath>

#include <fmt/core.h>

namespace vedit {

std::string format_number(double value) {
  if (value == 0.0 || !std::isfinite(value))
    return "0";

  std::string s = fmt::format("{:.6f}", value);
  auto dot = s.find('.');
  if (dot != std::string::npos) {
    auto last = s.find_last_not_of('0');
    s.erase(last == dot ? dot : last + 1);
  }
  if (s == "-0")
    return "0";
  return s;
}

std::string expr_number(double value) {
  std::string s = format_number(value);
  return s.front() == '-' ? "(" + s + ")" : s;
}

std::string eased_fraction_expr(const std::string &fraction, Easing easing) {
  const std::string &f = fraction;
  switch (easing) {
  case Easing::EaseIn:
    return fmt::format("({0}*{0})", f);
  case Easing::EaseOut:
    return fmt::format("({0}*(2-{0}))", f);
  case Easing::EaseInOut:
    return fmt::format("if(lt({0}\\,0.5)\\,2*{0}*{0}\\,-1+(4-2*{0})*{0})", f);
  case Easing::Linear:
    break;
  }
  return f;
}

std::string anim_expr(const std::vector<OverlayKeyframe> &keyframes,
                      double OverlayKeyframe::*field,
                      const std::string &default_expr, double clip_start) {
  if (keyframes.empty())
    return default_expr;

  const std::string local_t = fmt::format("(t-{})", expr_number(clip_start));

  /// Build from the last keyframe backwards: each step wraps the tail
  std::string expr = expr_number(keyframes.back().*field);

  for (std::size_t j = keyframes.size() - 1; j-- > 0;) {
    const auto &k1 = keyframes[j];
    const auto &k2 = keyframes[j + 1];
    double v1 = k1.*field;
    double v2 = k2.*field;
    double span = k2.time - k1.time;

    std::string segment;
    if (span <= 0.0) {
      segment = expr_number(v1);
    } else {
      std::string fraction = fmt::format("(({}-{})/{})", local_t,
                                         expr_number(k1.time),
                                         expr_number(span));
      segment = fmt::format("({}+({}-{})*{})", expr_number(v1),
                            expr_number(v2), expr_number(v1),
                            eased_fraction_expr(fraction, k1.easing));
    }
    expr = fmt::format("if(lte({}\\,{})\\,{}\\,{})", local_t,
                       expr_number(k2.time), segment, expr);
  }

  const auto &first = keyframes.front();
  return fmt::format("if(lte({}\\,{})\\,{}\\,{})", local_t,
                     expr_number(first.time), expr_number(first.*field), expr);
}

std::string escape_drawtext(const std::string &text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '\'':
      out += "'\\\\'";
      break;
    case ':':
      out += "\\\\:";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string ffmpeg_color(const std::string &color) {
  if (color.empty())
    return "white";
  if (color.front() == '#')
    return "0x" + color.substr(1);
  return color;
}

} // namespace vedit
