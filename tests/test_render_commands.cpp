#include "vedit/render_commands.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace vedit;

namespace {

/// Value following `flag` in args, or "" when absent
std::string arg_after(const Args &args, const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end())
    return {};
  return *(it + 1);
}

bool has_arg(const Args &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

Clip overlay_clip(const std::string &id, double start, double duration) {
  Clip c;
  c.id = id;
  c.start_time = start;
  c.duration = duration;
  return c;
}

AssetInfo asset(const std::string &id, const std::string &path,
                AssetType type) {
  AssetInfo a;
  a.id = id;
  a.path = path;
  a.type = type;
  return a;
}

} // namespace

// ============================================================================
// Phase 1
// ============================================================================

TEST(AtempoChain, WithinRangeIsSingleStage) {
  EXPECT_EQ(atempo_chain(1.0), "atempo=1");
  EXPECT_EQ(atempo_chain(2.0), "atempo=2");
  EXPECT_EQ(atempo_chain(0.5), "atempo=0.5");
}

TEST(AtempoChain, SlowSpeedsAreChained) {
  EXPECT_EQ(atempo_chain(0.25), "atempo=0.5,atempo=0.5");
  EXPECT_EQ(atempo_chain(0.3), "atempo=0.5,atempo=0.6");
}

TEST(AtempoChain, FastSpeedsAreChained) {
  EXPECT_EQ(atempo_chain(250.0), "atempo=100,atempo=2.5");
}

TEST(RangedSegmentArgs, WithSourceAudio) {
  PlannedSegment seg;
  seg.source_start = 2.0;
  seg.source_end = 4.0;
  seg.speed = 2.0;
  seg.timeline_duration = 1.0;

  RenderFormat format;
  Args args = ranged_segment_args("/media/a.mp4", seg, 30.0, true, format,
                                  "/tmp/seg.mov");
  EXPECT_EQ(args.front(), "-y");
  EXPECT_EQ(args.back(), "/tmp/seg.mov");
  EXPECT_EQ(arg_after(args, "-ss"), "2");
  EXPECT_EQ(arg_after(args, "-t"), "2");
  EXPECT_EQ(arg_after(args, "-i"), "/media/a.mp4");
  EXPECT_EQ(arg_after(args, "-vf"),
            "setpts=0.5*PTS,fps=30,scale=trunc(iw/2)*2:trunc(ih/2)*2");
  EXPECT_EQ(arg_after(args, "-af"), "atempo=2");
  EXPECT_EQ(arg_after(args, "-c:v"), "libx264");
  EXPECT_EQ(arg_after(args, "-pix_fmt"), "yuv420p");
  EXPECT_EQ(arg_after(args, "-c:a"), "pcm_s16le");
  EXPECT_EQ(arg_after(args, "-ar"), "44100");
  EXPECT_FALSE(has_arg(args, "-filter_complex"));
}

TEST(RangedSegmentArgs, SilentSourceGetsSynthesizedAudio) {
  PlannedSegment seg;
  seg.source_start = 0.0;
  seg.source_end = 0.5;
  seg.speed = 0.5;
  seg.timeline_duration = 1.0;

  RenderFormat format;
  format.sample_rate = 48000;
  Args args = ranged_segment_args("/media/b.mp4", seg, 25.0, false, format,
                                  "/tmp/seg.mov");
  EXPECT_TRUE(has_arg(args, "anullsrc=r=48000:cl=stereo"));
  EXPECT_EQ(arg_after(args, "-filter_complex"),
            "[0:v]setpts=2*PTS,fps=25,scale=trunc(iw/2)*2:trunc(ih/2)*2[v];"
            "[1:a]atrim=duration=1[a]");
  EXPECT_TRUE(has_arg(args, "[v]"));
  EXPECT_TRUE(has_arg(args, "[a]"));
  EXPECT_TRUE(has_arg(args, "-shortest"));
  EXPECT_FALSE(has_arg(args, "-af"));
  EXPECT_EQ(args.back(), "/tmp/seg.mov");
}

TEST(HoldArgs, StillThenLoop) {
  Args still = still_frame_args("/media/a.mp4", 3.25, "/tmp/f.jpg");
  EXPECT_EQ(arg_after(still, "-ss"), "3.25");
  EXPECT_EQ(arg_after(still, "-vframes"), "1");
  EXPECT_EQ(still.back(), "/tmp/f.jpg");

  RenderFormat format;
  Args loop = hold_loop_args("/tmp/f.jpg", 1.5, 24.0, format, "/tmp/h.mov");
  EXPECT_EQ(arg_after(loop, "-loop"), "1");
  EXPECT_EQ(arg_after(loop, "-i"), "/tmp/f.jpg");
  EXPECT_EQ(arg_after(loop, "-t"), "1.5");
  EXPECT_EQ(arg_after(loop, "-vf"),
            "fps=24,scale=trunc(iw/2)*2:trunc(ih/2)*2");
  EXPECT_EQ(arg_after(loop, "-c:a"), "pcm_s16le");
  EXPECT_EQ(loop.back(), "/tmp/h.mov");
}

TEST(HoldArgs, BlackoutPaintsFrameBlack) {
  RenderFormat format;
  Args loop =
      hold_loop_args("/tmp/f.jpg", 2.0, 30.0, format, "/tmp/h.mov", true);
  EXPECT_EQ(arg_after(loop, "-vf"),
            "fps=30,scale=trunc(iw/2)*2:trunc(ih/2)*2,"
            "drawbox=x=0:y=0:w=iw:h=ih:color=black:t=fill");
}

// ============================================================================
// Phase 2
// ============================================================================

TEST(ConcatList, OneLinePerFileWithQuotesEscaped) {
  EXPECT_EQ(concat_list({"/tmp/a.mov", "/tmp/it's.mov"}),
            "file '/tmp/a.mov'\nfile '/tmp/it'\\''s.mov'\n");
  EXPECT_EQ(concat_list({}), "");
}

TEST(ConcatArgs, CopiesVideoTranscodesAudio) {
  Args args = concat_args("/tmp/list.txt", "/tmp/out.mp4");
  EXPECT_EQ(arg_after(args, "-f"), "concat");
  EXPECT_EQ(arg_after(args, "-safe"), "0");
  EXPECT_EQ(arg_after(args, "-c:v"), "copy");
  EXPECT_EQ(arg_after(args, "-c:a"), "aac");
  EXPECT_EQ(args.back(), "/tmp/out.mp4");
}

TEST(BlankCanvasArgs, UsesCanvasSize) {
  RenderFormat format;
  format.canvas_width = 640;
  format.canvas_height = 360;
  Args args = blank_canvas_args(7.5, format, "/tmp/out.mp4");
  EXPECT_TRUE(has_arg(args, "color=c=black:s=640x360:d=7.5:r=30"));
  EXPECT_TRUE(has_arg(args, "anullsrc=r=44100:cl=stereo"));
  EXPECT_EQ(args.back(), "/tmp/out.mp4");
}

// ============================================================================
// Phase 3
// ============================================================================

TEST(OverlayGraph, EmptyWithoutOverlays) {
  RenderFormat format;
  FilterGraph graph = overlay_graph({}, 10.0, format);
  EXPECT_TRUE(graph.empty());
  EXPECT_TRUE(graph.inputs.empty());
}

TEST(OverlayGraph, TextOverlayDefaults) {
  Clip text = overlay_clip("t", 1.0, 2.0);
  text.properties.text = "Hi";
  RenderFormat format;
  format.font_path = "/fonts/a.ttf";

  FilterGraph graph =
      overlay_graph({{&text, TrackKind::OverlayText, nullptr}}, 10.0, format);
  ASSERT_EQ(graph.lines.size(), 1u);
  EXPECT_EQ(graph.lines[0],
            "[0:v]drawtext=fontfile=/fonts/a.ttf:text='Hi':fontsize=48"
            ":fontcolor=white:x=(w-text_w)/2:y=(h-text_h)/2:alpha=1"
            ":enable=between(t\\,1\\,3)[vout]");
  EXPECT_EQ(graph.output_label, "[vout]");
  EXPECT_TRUE(graph.inputs.empty());
}

TEST(OverlayGraph, TextPropertiesAreApplied) {
  Clip text = overlay_clip("t", 0.0, 4.0);
  text.properties.font_size = 72;
  text.properties.color = "#00ff00";
  text.properties.font_file = "/fonts/b.ttf";
  RenderFormat format;
  format.font_path = "/fonts/a.ttf";

  FilterGraph graph =
      overlay_graph({{&text, TrackKind::OverlayText, nullptr}}, 4.0, format);
  ASSERT_EQ(graph.lines.size(), 1u);
  const std::string &line = graph.lines[0];
  EXPECT_NE(line.find("text='Text'"), std::string::npos);
  EXPECT_NE(line.find("fontsize=72"), std::string::npos);
  EXPECT_NE(line.find("fontcolor=0x00ff00"), std::string::npos);
  EXPECT_NE(line.find("drawtext=fontfile=/fonts/b.ttf:"), std::string::npos);
}

TEST(OverlayGraph, FontFamilyUsesFontconfig) {
  Clip text = overlay_clip("t", 0.0, 4.0);
  text.properties.font = "Inter";
  RenderFormat format;
  format.font_path = "/fonts/a.ttf";

  FilterGraph graph =
      overlay_graph({{&text, TrackKind::OverlayText, nullptr}}, 4.0, format);
  ASSERT_EQ(graph.lines.size(), 1u);
  const std::string &line = graph.lines[0];
  EXPECT_NE(line.find("drawtext=font=Inter:"), std::string::npos);
  EXPECT_EQ(line.find("fontfile="), std::string::npos);
}

TEST(OverlayGraph, FontFileWinsOverFamily) {
  Clip text = overlay_clip("t", 0.0, 4.0);
  text.properties.font = "Inter";
  text.properties.font_file = "/fonts/c.otf";
  RenderFormat format;
  format.font_path = "/fonts/a.ttf";

  FilterGraph graph =
      overlay_graph({{&text, TrackKind::OverlayText, nullptr}}, 4.0, format);
  ASSERT_EQ(graph.lines.size(), 1u);
  EXPECT_NE(graph.lines[0].find("drawtext=fontfile=/fonts/c.otf:"),
            std::string::npos);
  EXPECT_EQ(graph.lines[0].find("font=Inter"), std::string::npos);
}

TEST(OverlayGraph, ImageThenTextChainsLabels) {
  AssetInfo logo = asset("logo", "/img/logo.png", AssetType::Image);
  Clip image = overlay_clip("i", 0.0, 5.0);
  image.asset_id = "logo";
  Clip text = overlay_clip("t", 2.0, 1.0);
  RenderFormat format;
  format.font_path = "/fonts/a.ttf";

  FilterGraph graph =
      overlay_graph({{&image, TrackKind::OverlayImage, &logo},
                     {&text, TrackKind::OverlayText, nullptr}},
                    10.0, format);

  Args expected_inputs = {"-loop", "1", "-t", "10", "-i", "/img/logo.png"};
  EXPECT_EQ(graph.inputs, expected_inputs);
  ASSERT_EQ(graph.lines.size(), 3u);
  EXPECT_EQ(graph.lines[0],
            "[1:v]format=rgba,rotate=(0)*PI/180:c=none:ow=rotw(iw)"
            ":oh=roth(ih),scale=eval=frame:w=iw*(1):h=ih*(1)"
            ",colorchannelmixer=aa=1[ov0]");
  EXPECT_EQ(graph.lines[1], "[0:v][ov0]overlay=x=100:y=100"
                            ":enable=between(t\\,0\\,5):eval=frame[v0]");
  EXPECT_EQ(graph.lines[2].rfind("[v0]drawtext=", 0), 0u);
  EXPECT_EQ(graph.lines[2].substr(graph.lines[2].size() - 6), "[vout]");

  EXPECT_EQ(graph.script(),
            graph.lines[0] + ";\n" + graph.lines[1] + ";\n" + graph.lines[2]);
}

TEST(OverlayGraph, ImageWithoutAssetIsSkipped) {
  Clip image = overlay_clip("i", 0.0, 5.0);
  RenderFormat format;
  FilterGraph graph =
      overlay_graph({{&image, TrackKind::OverlayImage, nullptr}}, 5.0, format);
  EXPECT_TRUE(graph.empty());
}

TEST(OverlayArgs, MapsCompositeAndKeepsAudio) {
  AssetInfo logo = asset("logo", "/img/logo.png", AssetType::Image);
  Clip image = overlay_clip("i", 0.0, 5.0);
  RenderFormat format;
  FilterGraph graph =
      overlay_graph({{&image, TrackKind::OverlayImage, &logo}}, 5.0, format);

  Args args = overlay_args("/tmp/base.mp4", graph, "/tmp/ov.txt", "/tmp/o.mp4");
  EXPECT_EQ(args[1], "-i");
  EXPECT_EQ(args[2], "/tmp/base.mp4");
  EXPECT_EQ(arg_after(args, "-filter_complex_script"), "/tmp/ov.txt");
  EXPECT_TRUE(has_arg(args, "[vout]"));
  EXPECT_TRUE(has_arg(args, "0:a?"));
  EXPECT_TRUE(has_arg(args, "/img/logo.png"));
  EXPECT_EQ(args.back(), "/tmp/o.mp4");
}

// ============================================================================
// Phase 4
// ============================================================================

TEST(AudioMixGraph, MixesClipsOverBed) {
  AssetInfo music = asset("m", "/audio/m.mp3", AssetType::Audio);
  AssetInfo voice = asset("v", "/audio/v.wav", AssetType::Audio);

  Clip first = overlay_clip("c1", 1.25, 3.0);
  first.in_point = 0.5;
  first.properties.volume = 0.8;
  Clip second = overlay_clip("c2", 0.0, 2.0);
  second.properties.muted = true;

  FilterGraph graph = audio_mix_graph({{&first, &music}, {&second, &voice}});
  Args expected_inputs = {"-i", "/audio/m.mp3", "-i", "/audio/v.wav"};
  EXPECT_EQ(graph.inputs, expected_inputs);
  ASSERT_EQ(graph.lines.size(), 5u);
  EXPECT_EQ(graph.lines[0],
            "[1:a]atrim=start=0.5:duration=3,asetpts=PTS-STARTPTS,"
            "adelay=1250|1250,volume=0.8[a0]");
  EXPECT_EQ(graph.lines[1],
            "[2:a]atrim=start=0:duration=2,asetpts=PTS-STARTPTS,"
            "adelay=0|0,volume=0[a1]");
  EXPECT_EQ(graph.lines[2], "[a0][a1]amix=inputs=2:duration=longest[mixed_bg]");
  EXPECT_EQ(graph.lines[3], "[0:a]volume=1[maina]");
  EXPECT_EQ(graph.lines[4],
            "[maina][mixed_bg]amix=inputs=2:duration=first[final_a]");
  EXPECT_EQ(graph.output_label, "[final_a]");
}

TEST(AudioMixGraph, SkipsMissingAndImageAssets) {
  AssetInfo still = asset("s", "/img/s.png", AssetType::Image);
  Clip a = overlay_clip("a", 0.0, 1.0);
  Clip b = overlay_clip("b", 0.0, 1.0);
  FilterGraph graph = audio_mix_graph({{&a, nullptr}, {&b, &still}});
  EXPECT_TRUE(graph.empty());
  EXPECT_TRUE(graph.inputs.empty());
}

TEST(AudioMixArgs, EncodesAac) {
  AssetInfo music = asset("m", "/audio/m.mp3", AssetType::Audio);
  Clip c = overlay_clip("c", 0.0, 2.0);
  FilterGraph graph = audio_mix_graph({{&c, &music}});

  Args args = audio_mix_args("/tmp/base.mp4", graph, "/tmp/final.mp4");
  EXPECT_EQ(arg_after(args, "-filter_complex"), graph.inline_graph());
  EXPECT_EQ(arg_after(args, "-b:a"), "192k");
  EXPECT_TRUE(has_arg(args, "[final_a]"));
  EXPECT_EQ(arg_after(args, "-c:v"), "copy");
  EXPECT_EQ(args.back(), "/tmp/final.mp4");
}
