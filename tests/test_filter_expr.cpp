#include "vedit/filter_expr.hpp"
#include "vedit/keyframe_math.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <cstdlib>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vedit;

namespace {

/**
 * @brief Minimal evaluator for the expression subset the generator emits:
 *        numbers, t, + - * /, parentheses, if(), lt() and lte() with
 *        backslash-escaped argument separators.
 */
class ExprEvaluator {
public:
  ExprEvaluator(const std::string &text, double t) : s_(text), t_(t) {}

  double run() {
    double v = expr();
    if (pos_ != s_.size())
      throw std::runtime_error("trailing input at " + std::to_string(pos_));
    return v;
  }

private:
  double expr() {
    double v = term();
    while (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) {
      char op = s_[pos_++];
      double rhs = term();
      v = op == '+' ? v + rhs : v - rhs;
    }
    return v;
  }

  double term() {
    double v = factor();
    while (pos_ < s_.size() && (s_[pos_] == '*' || s_[pos_] == '/')) {
      char op = s_[pos_++];
      double rhs = factor();
      v = op == '*' ? v * rhs : v / rhs;
    }
    return v;
  }

  double factor() {
    if (pos_ >= s_.size())
      throw std::runtime_error("unexpected end");
    char c = s_[pos_];
    if (c == '-') {
      ++pos_;
      return -factor();
    }
    if (c == '(') {
      ++pos_;
      double v = expr();
      expect(')');
      return v;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
      std::size_t start = pos_;
      while (pos_ < s_.size() &&
             (std::isdigit(static_cast<unsigned char>(s_[pos_])) ||
              s_[pos_] == '.'))
        ++pos_;
      return std::strtod(s_.substr(start, pos_ - start).c_str(), nullptr);
    }

    std::size_t start = pos_;
    while (pos_ < s_.size() && std::isalpha(static_cast<unsigned char>(s_[pos_])))
      ++pos_;
    std::string name = s_.substr(start, pos_ - start);
    if (name == "t")
      return t_;

    expect('(');
    std::vector<double> args{expr()};
    while (pos_ + 1 < s_.size() && s_[pos_] == '\\' && s_[pos_ + 1] == ',') {
      pos_ += 2;
      args.push_back(expr());
    }
    expect(')');

    if (name == "if" && args.size() == 3)
      return args[0] != 0.0 ? args[1] : args[2];
    if (name == "lt" && args.size() == 2)
      return args[0] < args[1] ? 1.0 : 0.0;
    if (name == "lte" && args.size() == 2)
      return args[0] <= args[1] ? 1.0 : 0.0;
    throw std::runtime_error("unknown function '" + name + "'");
  }

  void expect(char c) {
    if (pos_ >= s_.size() || s_[pos_] != c)
      throw std::runtime_error(std::string("expected '") + c + "' at " +
                               std::to_string(pos_));
    ++pos_;
  }

  const std::string &s_;
  double t_;
  std::size_t pos_ = 0;
};

double eval_expr(const std::string &text, double t) {
  return ExprEvaluator(text, t).run();
}

OverlayKeyframe kf(double time, double x, Easing easing = Easing::Linear) {
  OverlayKeyframe k;
  k.time = time;
  k.x = x;
  k.easing = easing;
  return k;
}

} // namespace

// ============================================================================
// Number formatting
// ============================================================================

TEST(FormatNumber, TrimsTrailingZeros) {
  EXPECT_EQ(format_number(0.0), "0");
  EXPECT_EQ(format_number(2.0), "2");
  EXPECT_EQ(format_number(1.5), "1.5");
  EXPECT_EQ(format_number(-0.25), "-0.25");
  EXPECT_EQ(format_number(1.0 / 3.0), "0.333333");
  EXPECT_EQ(format_number(120.0), "120");
}

TEST(FormatNumber, TinyAndNonFiniteCollapseToZero) {
  EXPECT_EQ(format_number(1e-9), "0");
  EXPECT_EQ(format_number(-1e-9), "0");
  EXPECT_EQ(format_number(std::numeric_limits<double>::quiet_NaN()), "0");
  EXPECT_EQ(format_number(std::numeric_limits<double>::infinity()), "0");
}

TEST(FormatNumber, ExprNumberParenthesizesNegatives) {
  EXPECT_EQ(expr_number(3.0), "3");
  EXPECT_EQ(expr_number(-2.0), "(-2)");
}

// ============================================================================
// Expression structure
// ============================================================================

TEST(AnimExpr, EmptyKeyframesReturnDefault) {
  EXPECT_EQ(anim_expr({}, &OverlayKeyframe::x, "(w-text_w)/2", 4.0),
            "(w-text_w)/2");
}

TEST(AnimExpr, TwoLinearKeyframes) {
  std::vector<OverlayKeyframe> kfs = {kf(0, 10), kf(2, 30)};
  EXPECT_EQ(anim_expr(kfs, &OverlayKeyframe::x, "0", 1.0),
            R"x(if(lte((t-1)\,0)\,10\,if(lte((t-1)\,2)\,(10+(30-10)*(((t-1)-0)/2))\,30)))x");
}

TEST(AnimExpr, SingleKeyframeIsConstantAfterGuard) {
  std::vector<OverlayKeyframe> kfs = {kf(1, -5)};
  EXPECT_EQ(anim_expr(kfs, &OverlayKeyframe::x, "0", 0.0),
            R"x(if(lte((t-0)\,1)\,(-5)\,(-5)))x");
}

TEST(AnimExpr, EasedFractions) {
  EXPECT_EQ(eased_fraction_expr("f", Easing::Linear), "f");
  EXPECT_EQ(eased_fraction_expr("f", Easing::EaseIn), "(f*f)");
  EXPECT_EQ(eased_fraction_expr("f", Easing::EaseOut), "(f*(2-f))");
  EXPECT_EQ(eased_fraction_expr("f", Easing::EaseInOut),
            R"x(if(lt(f\,0.5)\,2*f*f\,-1+(4-2*f)*f))x");
}

// ============================================================================
// Evaluation parity with interpolate_overlay
// ============================================================================

TEST(AnimExpr, EvaluatesLikeInterpolation) {
  std::vector<OverlayKeyframe> kfs = {kf(0.5, 0, Easing::EaseIn),
                                      kf(2, 100, Easing::EaseOut),
                                      kf(3, -40, Easing::EaseInOut),
                                      kf(5, 20, Easing::Linear)};
  const double clip_start = 7.25;
  std::string expr = anim_expr(kfs, &OverlayKeyframe::x, "0", clip_start);

  for (int i = 0; i <= 140; ++i) {
    double local = i * 0.05;
    double expected = interpolate_overlay(local, kfs).x;
    EXPECT_NEAR(eval_expr(expr, clip_start + local), expected, 1e-6)
        << "local t = " << local;
  }
}

TEST(AnimExpr, EvaluatesLikeInterpolationForRandomCurves) {
  std::mt19937 rng(99);
  std::uniform_int_distribution<int> value_dist(-200, 200);
  std::uniform_int_distribution<int> gap_dist(1, 8);
  std::uniform_int_distribution<int> easing_dist(0, 3);

  for (int trial = 0; trial < 50; ++trial) {
    std::vector<OverlayKeyframe> kfs;
    double time = 0.25 * gap_dist(rng);
    int count = 1 + trial % 5;
    for (int i = 0; i < count; ++i) {
      OverlayKeyframe k;
      k.time = time;
      k.opacity = value_dist(rng) / 400.0 + 0.5;
      k.easing = static_cast<Easing>(easing_dist(rng));
      kfs.push_back(k);
      time += 0.25 * gap_dist(rng);
    }

    std::string expr = anim_expr(kfs, &OverlayKeyframe::opacity, "1", 2.0);
    for (int i = 0; i <= 100; ++i) {
      double local = (time + 1.0) * i / 100.0;
      ASSERT_NEAR(eval_expr(expr, 2.0 + local),
                  interpolate_overlay(local, kfs).opacity, 1e-6)
          << "trial " << trial << " local t = " << local;
    }
  }
}

// ============================================================================
// Text and colors
// ============================================================================

TEST(EscapeDrawtext, EscapesQuotesColonsAndBackslashes) {
  EXPECT_EQ(escape_drawtext("Hello"), "Hello");
  EXPECT_EQ(escape_drawtext("It's 5:00"), "It'\\\\'s 5\\\\:00");
  EXPECT_EQ(escape_drawtext("a\\b"), "a\\\\b");
}

TEST(FfmpegColor, ConvertsHexAndDefaults) {
  EXPECT_EQ(ffmpeg_color(""), "white");
  EXPECT_EQ(ffmpeg_color("#ff8800"), "0xff8800");
  EXPECT_EQ(ffmpeg_color("yellow"), "yellow");
}
