/**
 * @file render_commands.cpp
 * @brief Encoder argument builders implementation
 */

#include "vedit/render_commands.hpp"

#include <cmath>

#include <fmt/core.h>

#include "vedit/filter_expr.hpp"

namespace vedit {

namespace {

const char *EVEN_SCALE = "scale=trunc(iw/2)*2:trunc(ih/2)*2";

std::string silence_source(const RenderFormat &format) {
  return fmt::format("anullsrc=r={}:cl=stereo", format.sample_rate);
}

std::string video_filter(double speed, double fps) {
  return fmt::format("setpts={}*PTS,fps={},{}", format_number(1.0 / speed),
                     format_number(fps), EVEN_SCALE);
}

/// Intermediate profile shared by every phase-1 artifact
void append_intermediate_codecs(Args &args, const RenderFormat &format) {
  args.insert(args.end(), {"-c:v", "libx264", "-pix_fmt", "yuv420p", "-c:a",
                           "pcm_s16le", "-ar",
                           std::to_string(format.sample_rate), "-ac", "2"});
}

/// Option values inside a filter graph: ':' and '\' are separators
std::string escape_option_value(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == ':' || c == '\\' || c == '\'')
      out += '\\';
    out += c;
  }
  return out;
}

std::string enable_between(const Clip &clip) {
  return fmt::format("enable=between(t\\,{}\\,{})",
                     format_number(clip.start_time),
                     format_number(clip.end_time()));
}

std::string join(const std::vector<std::string> &lines,
                 const std::string &sep) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i)
      out += sep;
    out += lines[i];
  }
  return out;
}

} // namespace

// **---- Phase 1: Segments ----**

Args still_frame_args(const std::string &asset_path, double seek,
                      const std::string &frame_path) {
  return {"-y",        "-ss", format_number(seek), "-i",  asset_path,
          "-vframes",  "1",   "-vf",               EVEN_SCALE, "-q:v",
          "2",         frame_path};
}

Args hold_loop_args(const std::string &frame_path, double duration,
                    double fps, const RenderFormat &format,
                    const std::string &out, bool blackout) {
  std::string vf = fmt::format("fps={},{}", format_number(fps), EVEN_SCALE);
  if (blackout)
    vf += ",drawbox=x=0:y=0:w=iw:h=ih:color=black:t=fill";

  Args args = {"-y", "-loop", "1", "-i", frame_path,
               "-t", format_number(duration),
               "-f", "lavfi", "-i", silence_source(format),
               "-t", format_number(duration),
               "-vf", vf};
  append_intermediate_codecs(args, format);
  args.insert(args.end(), {"-shortest", out});
  return args;
}

std::string atempo_chain(double speed) {
  std::vector<std::string> stages;
  double remaining = speed;
  while (remaining > 100.0) {
    stages.push_back("atempo=100");
    remaining /= 100.0;
  }
  while (remaining < 0.5) {
    stages.push_back("atempo=0.5");
    remaining /= 0.5;
  }
  stages.push_back("atempo=" + format_number(remaining));
  return join(stages, ",");
}

Args ranged_segment_args(const std::string &asset_path,
                         const PlannedSegment &seg, double fps,
                         bool source_audio, const RenderFormat &format,
                         const std::string &out) {
  Args args = {"-y", "-ss", format_number(seg.source_start),
               "-t", format_number(seg.source_duration()),
               "-i", asset_path};
  std::string vf = video_filter(seg.speed, fps);

  if (source_audio) {
    args.insert(args.end(), {"-vf", vf, "-af", atempo_chain(seg.speed)});
    append_intermediate_codecs(args, format);
    args.push_back(out);
    return args;
  }

  // Silent audio keeps the stream layout uniform for concatenation
  args.insert(args.end(), {"-f", "lavfi", "-i", silence_source(format)});
  args.insert(args.end(),
              {"-filter_complex",
               fmt::format("[0:v]{}[v];[1:a]atrim=duration={}[a]", vf,
                           format_number(seg.timeline_duration)),
               "-map", "[v]", "-map", "[a]"});
  append_intermediate_codecs(args, format);
  args.insert(args.end(), {"-shortest", out});
  return args;
}

// **---- Phase 2: Concatenation ----**

std::string concat_list(const std::vector<std::string> &paths) {
  std::string list;
  for (const auto &path : paths) {
    std::string quoted;
    for (char c : path) {
      if (c == '\'')
        quoted += "'\\''";
      else
        quoted += c;
    }
    list += fmt::format("file '{}'\n", quoted);
  }
  return list;
}

Args concat_args(const std::string &list_path, const std::string &out) {
  return {"-y",   "-f",   "concat", "-safe", "0",   "-i",
          list_path, "-c:v", "copy", "-c:a",  "aac", out};
}

Args blank_canvas_args(double duration, const RenderFormat &format,
                       const std::string &out) {
  return {"-y",
          "-f",
          "lavfi",
          "-i",
          fmt::format("color=c=black:s={}x{}:d={}:r={}", format.canvas_width,
                      format.canvas_height, format_number(duration),
                      format_number(format.fps)),
          "-f",
          "lavfi",
          "-i",
          silence_source(format),
          "-c:v",
          "libx264",
          "-c:a",
          "aac",
          "-shortest",
          "-pix_fmt",
          "yuv420p",
          out};
}

// **---- Phases 3 and 4: Compositing ----**

std::string FilterGraph::script() const { return join(lines, ";\n"); }

std::string FilterGraph::inline_graph() const { return join(lines, ";"); }

FilterGraph overlay_graph(const std::vector<OverlaySource> &overlays,
                          double total_duration, const RenderFormat &format) {
  FilterGraph graph;
  std::string last = "[0:v]";
  int next_input = 1;
  int index = 0;

  for (const auto &ov : overlays) {
    if (!ov.clip)
      continue;
    const Clip &clip = *ov.clip;
    const auto &kfs = clip.overlay_keyframes;
    const double start = clip.start_time;
    std::string out_label = fmt::format("[v{}]", index);

    if (ov.kind == TrackKind::OverlayImage) {
      if (!ov.asset)
        continue;
      std::string x = anim_expr(kfs, &OverlayKeyframe::x, "100", start);
      std::string y = anim_expr(kfs, &OverlayKeyframe::y, "100", start);
      std::string sx = anim_expr(kfs, &OverlayKeyframe::scale_x, "1", start);
      std::string sy = anim_expr(kfs, &OverlayKeyframe::scale_y, "1", start);
      std::string rot = anim_expr(kfs, &OverlayKeyframe::rotation, "0", start);
      std::string alpha =
          anim_expr(kfs, &OverlayKeyframe::opacity, "1", start);

      int input = next_input++;
      graph.inputs.insert(graph.inputs.end(),
                          {"-loop", "1", "-t", format_number(total_duration),
                           "-i", ov.asset->path});
      std::string ov_label = fmt::format("[ov{}]", index);
      graph.lines.push_back(fmt::format(
          "[{}:v]format=rgba,rotate=({})*PI/180:c=none:ow=rotw(iw):oh=roth(ih),"
          "scale=eval=frame:w=iw*({}):h=ih*({}),colorchannelmixer=aa={}{}",
          input, rot, sx, sy, alpha, ov_label));
      graph.lines.push_back(
          fmt::format("{}{}overlay=x={}:y={}:{}:eval=frame{}", last, ov_label,
                      x, y, enable_between(clip), out_label));
    } else {
      const auto &props = clip.properties;
      std::string text = props.text.empty() ? "Text" : props.text;
      std::string x = anim_expr(kfs, &OverlayKeyframe::x, "(w-text_w)/2", start);
      std::string y = anim_expr(kfs, &OverlayKeyframe::y, "(h-text_h)/2", start);
      std::string alpha =
          anim_expr(kfs, &OverlayKeyframe::opacity, "1", start);
      /// A family name goes through fontconfig, anything else is a file
      std::string font;
      if (!props.font_file.empty())
        font = "fontfile=" + escape_option_value(props.font_file);
      else if (!props.font.empty())
        font = "font=" + escape_option_value(props.font);
      else
        font = "fontfile=" + escape_option_value(format.font_path);

      graph.lines.push_back(fmt::format(
          "{}drawtext={}:text='{}':fontsize={}:fontcolor={}"
          ":x={}:y={}:alpha={}:{}{}",
          last, font, escape_drawtext(text),
          format_number(props.font_size), ffmpeg_color(props.color), x, y,
          alpha, enable_between(clip), out_label));
    }
    last = out_label;
    ++index;
  }

  if (!graph.lines.empty()) {
    // Rename the last label so callers can always map [vout]
    std::string &tail = graph.lines.back();
    tail.erase(tail.size() - last.size());
    tail += "[vout]";
    graph.output_label = "[vout]";
  }
  return graph;
}

Args overlay_args(const std::string &base, const FilterGraph &graph,
                  const std::string &script_path, const std::string &out) {
  Args args = {"-y", "-i", base};
  args.insert(args.end(), graph.inputs.begin(), graph.inputs.end());
  args.insert(args.end(),
              {"-filter_complex_script", script_path, "-map",
               graph.output_label, "-map", "0:a?", "-c:v", "libx264",
               "-preset", "fast", "-pix_fmt", "yuv420p", "-c:a", "copy", out});
  return args;
}

FilterGraph audio_mix_graph(const std::vector<AudioSource> &sources) {
  FilterGraph graph;
  std::string mix_inputs;
  int next_input = 1;
  int mixed = 0;

  for (const auto &src : sources) {
    if (!src.clip || !src.asset || src.asset->type == AssetType::Image)
      continue;
    const Clip &clip = *src.clip;
    const auto delay_ms = std::llround(clip.start_time * 1000.0);
    double volume = clip.properties.muted ? 0.0 : clip.properties.volume;

    int input = next_input++;
    graph.inputs.insert(graph.inputs.end(), {"-i", src.asset->path});
    std::string label = fmt::format("[a{}]", mixed++);
    graph.lines.push_back(fmt::format(
        "[{}:a]atrim=start={}:duration={},asetpts=PTS-STARTPTS,"
        "adelay={}|{},volume={}{}",
        input, format_number(clip.in_point), format_number(clip.duration),
        delay_ms, delay_ms, format_number(volume), label));
    mix_inputs += label;
  }

  if (mixed == 0)
    return graph;

  graph.lines.push_back(fmt::format("{}amix=inputs={}:duration=longest[mixed_bg]",
                                    mix_inputs, mixed));
  graph.lines.push_back("[0:a]volume=1[maina]");
  graph.lines.push_back(
      "[maina][mixed_bg]amix=inputs=2:duration=first[final_a]");
  graph.output_label = "[final_a]";
  return graph;
}

Args audio_mix_args(const std::string &base, const FilterGraph &graph,
                    const std::string &out) {
  Args args = {"-y", "-i", base};
  args.insert(args.end(), graph.inputs.begin(), graph.inputs.end());
  args.insert(args.end(),
              {"-filter_complex", graph.inline_graph(), "-map", "0:v", "-map",
               graph.output_label, "-c:v", "copy", "-c:a", "aac", "-b:a",
               "192k", "-shortest", out});
  return args;
}

} // namespace vedit
