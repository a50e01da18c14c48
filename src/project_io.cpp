/**
 * @file project_io.cpp
 * @brief JSON wire boundary implementation
 */

#include "vedit/project_io.hpp"

#include <fstream>
#include <initializer_list>

#include <fmt/core.h>

#include "vedit/errors.hpp"
#include "vedit/logging.hpp"
#include "vedit/project.hpp"

using json = nlohmann::json;

namespace vedit {

namespace {

// **---- Field Access ----**

/// First non-null field among the accepted names
const json *find_field(const json &obj,
                       std::initializer_list<const char *> names) {
  if (!obj.is_object())
    return nullptr;
  for (const char *name : names) {
    auto it = obj.find(name);
    if (it != obj.end() && !it->is_null())
      return &*it;
  }
  return nullptr;
}

double number_field(const json &obj, std::initializer_list<const char *> names,
                    double default_val) {
  const json *v = find_field(obj, names);
  if (!v)
    return default_val;
  if (v->is_number())
    return v->get<double>();
  if (v->is_boolean())
    return v->get<bool>() ? 1.0 : 0.0;
  if (v->is_string()) {
    try {
      return std::stod(v->get<std::string>());
    } catch (const std::exception &) {
      // reported below
    }
  }
  throw ValidationError(
      fmt::format("field '{}' is not a number", *names.begin()));
}

std::string string_field(const json &obj,
                         std::initializer_list<const char *> names,
                         const std::string &default_val = {}) {
  const json *v = find_field(obj, names);
  if (!v)
    return default_val;
  if (v->is_string())
    return v->get<std::string>();
  if (v->is_number())
    return v->dump();
  throw ValidationError(
      fmt::format("field '{}' is not a string", *names.begin()));
}

std::optional<bool> bool_field(const json &obj,
                               std::initializer_list<const char *> names) {
  const json *v = find_field(obj, names);
  if (!v)
    return std::nullopt;
  if (v->is_boolean())
    return v->get<bool>();
  if (v->is_number())
    return v->get<double>() != 0.0;
  if (v->is_string())
    return v->get<std::string>() == "true" || v->get<std::string>() == "1";
  throw ValidationError(
      fmt::format("field '{}' is not a boolean", *names.begin()));
}

// **---- Clip Parts ----**

ClipProperties parse_properties(const json *value, const std::string &clip_id) {
  ClipProperties props;
  if (!value)
    return props;

  json obj = *value;
  if (value->is_string()) {
    obj = json::parse(value->get<std::string>(), nullptr, false);
    if (obj.is_discarded()) {
      LOG_WARN("Clip '{}': unparsable properties ignored", clip_id);
      return props;
    }
  }
  if (!obj.is_object())
    return props;

  props.muted = bool_field(obj, {"muted"}).value_or(false);
  props.volume = number_field(obj, {"volume"}, 1.0);
  props.text = string_field(obj, {"text"});
  props.font_size = number_field(obj, {"font_size", "fontSize"}, 48.0);
  props.color = string_field(obj, {"color"});
  props.font = string_field(obj, {"font", "fontFamily"});
  props.font_file = string_field(obj, {"font_file", "fontFile"});
  props.transition = string_field(obj, {"transition"});

  static const char *const known[] = {
      "muted", "volume",   "text",      "font_size",  "fontSize",
      "color", "font",     "fontFamily", "font_file", "fontFile",
      "transition"};
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    bool is_known = false;
    for (const char *k : known)
      is_known = is_known || it.key() == k;
    if (!is_known)
      props.extra[it.key()] =
          it.value().is_string() ? it.value().get<std::string>()
                                 : it.value().dump();
  }
  return props;
}

std::vector<SpeedKeyframe> parse_speed_keyframes(const json *arr) {
  std::vector<SpeedKeyframe> out;
  if (!arr || !arr->is_array())
    return out;
  for (const auto &k : *arr) {
    SpeedKeyframe kf;
    kf.time = number_field(k, {"time"}, 0.0);
    kf.speed = number_field(k, {"speed"}, 1.0);
    out.push_back(kf);
  }
  return out;
}

std::vector<OverlayKeyframe> parse_overlay_keyframes(const json *arr) {
  std::vector<OverlayKeyframe> out;
  if (!arr || !arr->is_array())
    return out;
  for (const auto &k : *arr) {
    OverlayKeyframe kf;
    kf.time = number_field(k, {"time"}, 0.0);
    kf.x = number_field(k, {"x"}, 0.0);
    kf.y = number_field(k, {"y"}, 0.0);
    kf.scale_x = number_field(k, {"scale_x", "scaleX"}, 1.0);
    kf.scale_y = number_field(k, {"scale_y", "scaleY"}, 1.0);
    kf.rotation = number_field(k, {"rotation"}, 0.0);
    kf.opacity = number_field(k, {"opacity"}, 1.0);
    kf.easing = parse_easing(string_field(k, {"easing"}));
    out.push_back(kf);
  }
  return out;
}

Clip parse_clip(const json &c) {
  Clip clip;
  clip.id = string_field(c, {"id"});
  clip.start_time = number_field(c, {"start_time", "startTime"}, 0.0);
  clip.duration = number_field(c, {"duration"}, 0.0);
  clip.in_point = number_field(c, {"in_point", "inPoint"}, 0.0);
  clip.out_point =
      number_field(c, {"out_point", "outPoint"}, clip.in_point + clip.duration);
  std::string asset = string_field(c, {"asset_id", "assetId"});
  if (!asset.empty())
    clip.asset_id = asset;
  clip.properties = parse_properties(find_field(c, {"properties"}), clip.id);
  clip.speed_keyframes = parse_speed_keyframes(
      find_field(c, {"speed_keyframes", "speedKeyframes"}));
  clip.overlay_keyframes = parse_overlay_keyframes(
      find_field(c, {"overlay_keyframes", "overlayKeyframes"}));
  return clip;
}

AssetType parse_asset_type(const std::string &name) {
  if (name == "audio")
    return AssetType::Audio;
  if (name == "image")
    return AssetType::Image;
  return AssetType::Video;
}

const char *to_string(AssetType type) {
  switch (type) {
  case AssetType::Audio:
    return "audio";
  case AssetType::Image:
    return "image";
  case AssetType::Video:
    break;
  }
  return "video";
}

AssetInfo parse_asset(const json &a, const std::string &fallback_id) {
  AssetInfo asset;
  asset.id = string_field(a, {"id"}, fallback_id);
  asset.path = string_field(a, {"path", "file_path", "filePath"});
  asset.duration = number_field(a, {"duration"}, 0.0);
  asset.fps = number_field(a, {"fps"}, 0.0);
  asset.has_audio = bool_field(a, {"has_audio", "hasAudio"});
  asset.type = parse_asset_type(string_field(a, {"type"}, "video"));
  return asset;
}

} // anonymous namespace

// **---- Enumerations ----**

TrackKind parse_track_kind(const std::string &name) {
  for (TrackKind kind : ALL_TRACK_KINDS) {
    if (name == to_string(kind))
      return kind;
  }
  throw ValidationError(fmt::format("unknown track type '{}'", name));
}

Easing parse_easing(const std::string &name) {
  if (name == "easeIn" || name == "ease_in")
    return Easing::EaseIn;
  if (name == "easeOut" || name == "ease_out")
    return Easing::EaseOut;
  if (name == "easeInOut" || name == "ease_in_out")
    return Easing::EaseInOut;
  return Easing::Linear;
}

const char *to_string(Easing easing) {
  switch (easing) {
  case Easing::EaseIn:
    return "easeIn";
  case Easing::EaseOut:
    return "easeOut";
  case Easing::EaseInOut:
    return "easeInOut";
  case Easing::Linear:
    break;
  }
  return "linear";
}

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Queued:
    return "QUEUED";
  case JobStatus::Running:
    return "RUNNING";
  case JobStatus::Complete:
    return "COMPLETE";
  case JobStatus::Failed:
    return "FAILED";
  }
  return "FAILED";
}

JobStatus parse_job_status(const std::string &name) {
  for (JobStatus s : {JobStatus::Queued, JobStatus::Running,
                      JobStatus::Complete, JobStatus::Failed}) {
    if (name == to_string(s))
      return s;
  }
  throw ValidationError(fmt::format("unknown job status '{}'", name));
}

// **---- Projects ----**

Project parse_project(const json &doc) {
  if (!doc.is_object())
    throw ValidationError("project document must be a JSON object");

  Project project;
  try {
    project.id = string_field(doc, {"id"});
    project.name = string_field(doc, {"name"});

    if (const json *tracks = find_field(doc, {"tracks"})) {
      int position = 0;
      for (const auto &t : *tracks) {
        Track track;
        track.kind = parse_track_kind(string_field(t, {"type", "kind"}));
        track.id = string_field(
            t, {"id"}, fmt::format("{}:{}", project.id, to_string(track.kind)));
        track.order = static_cast<int>(number_field(t, {"order"}, position));
        if (const json *clips = find_field(t, {"clips"})) {
          for (const auto &c : *clips)
            track.clips.push_back(parse_clip(c));
        }
        project.tracks.push_back(std::move(track));
        ++position;
      }
    }

    if (const json *assets = find_field(doc, {"assets"})) {
      if (assets->is_array()) {
        for (const auto &a : *assets) {
          AssetInfo asset = parse_asset(a, {});
          project.assets[asset.id] = asset;
        }
      } else if (assets->is_object()) {
        for (auto it = assets->begin(); it != assets->end(); ++it) {
          AssetInfo asset = parse_asset(it.value(), it.key());
          project.assets[asset.id] = asset;
        }
      }
    }
  } catch (const json::exception &e) {
    throw ValidationError(fmt::format("malformed project: {}", e.what()));
  }

  normalize_project(project);
  validate_project(project);
  return project;
}

Project parse_project_text(const std::string &text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded())
    throw ValidationError("project is not valid JSON");
  return parse_project(doc);
}

Project load_project(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ValidationError(fmt::format("cannot open project file '{}'", path));
  json doc = json::parse(in, nullptr, false);
  if (doc.is_discarded())
    throw ValidationError(fmt::format("'{}' is not valid JSON", path));
  return parse_project(doc);
}

json project_to_json(const Project &project) {
  json doc;
  doc["id"] = project.id;
  doc["name"] = project.name;

  json tracks = json::array();
  for (const auto &track : project.tracks) {
    json clips = json::array();
    for (const auto &clip : track.clips) {
      json props = {{"muted", clip.properties.muted},
                    {"volume", clip.properties.volume},
                    {"font_size", clip.properties.font_size}};
      if (!clip.properties.text.empty())
        props["text"] = clip.properties.text;
      if (!clip.properties.color.empty())
        props["color"] = clip.properties.color;
      if (!clip.properties.font.empty())
        props["font"] = clip.properties.font;
      if (!clip.properties.font_file.empty())
        props["font_file"] = clip.properties.font_file;
      if (!clip.properties.transition.empty())
        props["transition"] = clip.properties.transition;
      for (const auto &kv : clip.properties.extra)
        props[kv.first] = kv.second;

      json speed = json::array();
      for (const auto &k : clip.speed_keyframes)
        speed.push_back({{"time", k.time}, {"speed", k.speed}});

      json overlay = json::array();
      for (const auto &k : clip.overlay_keyframes)
        overlay.push_back({{"time", k.time},
                           {"x", k.x},
                           {"y", k.y},
                           {"scale_x", k.scale_x},
                           {"scale_y", k.scale_y},
                           {"rotation", k.rotation},
                           {"opacity", k.opacity},
                           {"easing", to_string(k.easing)}});

      json c = {{"id", clip.id},
                {"start_time", clip.start_time},
                {"duration", clip.duration},
                {"in_point", clip.in_point},
                {"out_point", clip.out_point},
                {"properties", props},
                {"speed_keyframes", speed},
                {"overlay_keyframes", overlay}};
      c["asset_id"] = clip.asset_id ? json(*clip.asset_id) : json(nullptr);
      clips.push_back(c);
    }
    tracks.push_back({{"id", track.id},
                      {"type", to_string(track.kind)},
                      {"order", track.order},
                      {"clips", clips}});
  }
  doc["tracks"] = tracks;

  json assets = json::array();
  for (const auto &kv : project.assets) {
    const AssetInfo &a = kv.second;
    json asset = {{"id", a.id},         {"path", a.path},
                  {"duration", a.duration}, {"fps", a.fps},
                  {"type", to_string(a.type)}};
    asset["has_audio"] = a.has_audio ? json(*a.has_audio) : json(nullptr);
    assets.push_back(asset);
  }
  doc["assets"] = assets;
  return doc;
}

// **---- Job records ----**

json job_to_json(const ExportJob &job) {
  json doc = {{"id", job.id},
              {"project_id", job.project_id},
              {"request_id", job.request_id},
              {"status", to_string(job.status)},
              {"progress", job.progress},
              {"created_at", job.created_at},
              {"updated_at", job.updated_at},
              {"sequence", job.sequence}};
  doc["output_path"] =
      job.output_path.empty() ? json(nullptr) : json(job.output_path);
  doc["error"] = job.error.empty() ? json(nullptr) : json(job.error);
  return doc;
}

ExportJob job_from_json(const json &doc) {
  ExportJob job;
  try {
    job.id = string_field(doc, {"id"});
    job.project_id = string_field(doc, {"project_id"});
    job.request_id = string_field(doc, {"request_id"});
    job.status = parse_job_status(string_field(doc, {"status"}, "QUEUED"));
    job.progress = number_field(doc, {"progress"}, 0.0);
    job.output_path = string_field(doc, {"output_path"});
    job.error = string_field(doc, {"error"});
    job.created_at = string_field(doc, {"created_at"});
    job.updated_at = string_field(doc, {"updated_at"});
    if (const json *seq = find_field(doc, {"sequence"}))
      job.sequence = seq->get<std::uint64_t>();
  } catch (const json::exception &e) {
    throw ValidationError(fmt::format("malformed job record: {}", e.what()));
  }
  if (job.id.empty())
    throw ValidationError("job record without id");
  return job;
}

// **---- Evaluation results ----**

namespace {

json media_layer_json(const MediaLayer &layer) {
  return {{"clip_id", layer.clip->id},
          {"asset_id", layer.asset ? json(layer.asset->id) : json(nullptr)},
          {"local_time", layer.local_time},
          {"source_time", layer.source_time}};
}

json overlay_layer_json(const OverlayLayer &layer) {
  const OverlayTransform &t = layer.transform;
  json doc = {{"clip_id", layer.clip->id},
              {"local_time", layer.local_time},
              {"transform",
               {{"x", t.x},
                {"y", t.y},
                {"scale_x", t.scale_x},
                {"scale_y", t.scale_y},
                {"rotation", t.rotation},
                {"opacity", t.opacity}}}};
  if (layer.asset)
    doc["asset_id"] = layer.asset->id;
  else
    doc["text"] = layer.clip->properties.text;
  return doc;
}

} // anonymous namespace

json active_layers_to_json(const ActiveLayers &layers) {
  json doc;
  doc["video_a"] =
      layers.video_a ? media_layer_json(*layers.video_a) : json(nullptr);
  doc["video_b"] =
      layers.video_b ? media_layer_json(*layers.video_b) : json(nullptr);
  doc["overlay_texts"] = json::array();
  for (const auto &l : layers.overlay_texts)
    doc["overlay_texts"].push_back(overlay_layer_json(l));
  doc["overlay_images"] = json::array();
  for (const auto &l : layers.overlay_images)
    doc["overlay_images"].push_back(overlay_layer_json(l));
  doc["audio"] = json::array();
  for (const auto &l : layers.audio)
    doc["audio"].push_back(media_layer_json(l));
  return doc;
}

} // namespace vedit
