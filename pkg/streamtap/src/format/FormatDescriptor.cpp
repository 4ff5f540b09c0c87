// Repository: StreamTap
// Component: FormatDescriptor
// Purpose: Caps → descriptor resolution and the static video channel table.
// Copyright (c) 2025 RetroVue

#include "streamtap/format/FormatDescriptor.hpp"

#include <gst/audio/audio.h>
#include <gst/video/video.h>

#include <map>
#include <sstream>

#include "streamtap/runtime/Errors.hpp"

namespace streamtap::format {

namespace {

struct VideoFormatEntry {
  GstVideoFormat id = GST_VIDEO_FORMAT_UNKNOWN;
  int32_t channels = 0;
  ElementType element_type = ElementType::kUInt8;
  // True when one frame is a plain (height, width[, channels]) array.
  bool array_layout = false;
};

int32_t DeriveChannels(GstVideoFormat id, const GstVideoFormatInfo* info) {
  // BGRx carries a padding byte the flags do not report.
  if (id == GST_VIDEO_FORMAT_BGRx) return 4;
  if (GST_VIDEO_FORMAT_INFO_HAS_ALPHA(info)) return 4;
  if (GST_VIDEO_FORMAT_INFO_IS_RGB(info)) return 3;
  if (GST_VIDEO_FORMAT_INFO_IS_GRAY(info)) return 1;
  return 0;
}

ElementType VideoElementType(const GstVideoFormatInfo* info) {
  return GST_VIDEO_FORMAT_INFO_BITS(info) == 16 ? ElementType::kUInt16
                                                : ElementType::kUInt8;
}

ElementType AudioElementType(const GstAudioFormatInfo* info) {
  switch (GST_AUDIO_FORMAT_INFO_DEPTH(info)) {
    case 8:
      return ElementType::kInt8;
    case 16:
      return ElementType::kInt16;
    default:
      return ElementType::kUInt8;
  }
}

// Built once from the engine's own list of raw formats; read-only after.
const std::map<std::string, VideoFormatEntry>& VideoFormatTable() {
  static const std::map<std::string, VideoFormatEntry> table = []() {
    std::map<std::string, VideoFormatEntry> entries;
    std::string all = GST_VIDEO_FORMATS_ALL;
    for (char& c : all) {
      if (c == '{' || c == '}' || c == ',') c = ' ';
    }
    std::istringstream tokens(all);
    std::string tag;
    while (tokens >> tag) {
      const GstVideoFormat id = gst_video_format_from_string(tag.c_str());
      if (id == GST_VIDEO_FORMAT_UNKNOWN) continue;
      const GstVideoFormatInfo* info = gst_video_format_get_info(id);
      if (!info) continue;

      VideoFormatEntry entry;
      entry.id = id;
      entry.channels = DeriveChannels(id, info);
      entry.element_type = VideoElementType(info);
      entry.array_layout =
          entry.channels > 0 && GST_VIDEO_FORMAT_INFO_N_PLANES(info) == 1 &&
          !GST_VIDEO_FORMAT_INFO_IS_COMPLEX(info) &&
          static_cast<size_t>(GST_VIDEO_FORMAT_INFO_PSTRIDE(info, 0)) ==
              static_cast<size_t>(entry.channels) *
                  ElementSize(entry.element_type);
      entries.emplace(tag, entry);
    }
    return entries;
  }();
  return table;
}

const VideoFormatEntry& LookupVideoFormat(const std::string& tag) {
  const auto& table = VideoFormatTable();
  auto it = table.find(tag);
  if (it == table.end()) {
    throw FormatError("unknown video format '" + tag + "'");
  }
  return it->second;
}

VideoFormat FromVideoInfo(const GstVideoInfo& info) {
  const std::string tag = GST_VIDEO_INFO_NAME(&info);
  const VideoFormatEntry& entry = LookupVideoFormat(tag);
  if (!entry.array_layout) {
    throw FormatError("video format '" + tag +
                      "' has no array layout (need a single-plane RGB, "
                      "grayscale or alpha format)");
  }

  VideoFormat video;
  video.width = GST_VIDEO_INFO_WIDTH(&info);
  video.height = GST_VIDEO_INFO_HEIGHT(&info);
  video.channels = entry.channels;
  video.format = tag;
  video.element_type = entry.element_type;
  video.row_stride = static_cast<size_t>(GST_VIDEO_INFO_PLANE_STRIDE(&info, 0));
  video.framerate =
      RationalFps(GST_VIDEO_INFO_FPS_N(&info), GST_VIDEO_INFO_FPS_D(&info));
  if (video.width <= 0 || video.height <= 0) {
    throw FormatError("video caps have no frame size");
  }
  return video;
}

AudioFormat FromAudioParams(int32_t rate, int32_t channels,
                            const GstAudioFormatInfo* finfo,
                            size_t buffer_size) {
  if (rate <= 0 || channels <= 0) {
    throw FormatError("audio rate and channel count must be positive");
  }
  AudioFormat audio;
  audio.rate = rate;
  audio.channels = channels;
  audio.format = GST_AUDIO_FORMAT_INFO_NAME(finfo);
  audio.element_type = AudioElementType(finfo);
  audio.samples_per_channel = buffer_size / ElementSize(audio.element_type) /
                              static_cast<size_t>(channels);
  return audio;
}

}  // namespace

FormatDescriptor FormatDescriptor::FromCaps(const GstCaps* caps,
                                            size_t buffer_size) {
  if (!caps || gst_caps_is_empty(caps) || gst_caps_is_any(caps)) {
    throw FormatError("no negotiated caps");
  }
  if (!gst_caps_is_fixed(caps)) {
    throw FormatError("caps are not fixed: " + gst::CapsToString(caps));
  }

  const GstStructure* structure = gst_caps_get_structure(caps, 0);
  const std::string media = gst_structure_get_name(structure);

  if (media == "video/x-raw") {
    GstVideoInfo info;
    gst_video_info_init(&info);
    if (!gst_video_info_from_caps(&info, caps)) {
      throw FormatError("cannot parse video caps: " + gst::CapsToString(caps));
    }
    return FormatDescriptor(FromVideoInfo(info));
  }

  if (media == "audio/x-raw") {
    GstAudioInfo info;
    gst_audio_info_init(&info);
    if (!gst_audio_info_from_caps(&info, caps)) {
      throw FormatError("cannot parse audio caps: " + gst::CapsToString(caps));
    }
    if (GST_AUDIO_INFO_LAYOUT(&info) != GST_AUDIO_LAYOUT_INTERLEAVED) {
      throw FormatError("non-interleaved audio is not supported");
    }
    return FormatDescriptor(FromAudioParams(GST_AUDIO_INFO_RATE(&info),
                                            GST_AUDIO_INFO_CHANNELS(&info),
                                            info.finfo, buffer_size));
  }

  throw FormatError("unsupported media type '" + media + "'");
}

FormatDescriptor FormatDescriptor::Video(int32_t width, int32_t height,
                                         const std::string& format,
                                         RationalFps framerate) {
  if (width <= 0 || height <= 0) {
    throw FormatError("video width and height must be positive");
  }
  if (!framerate.FitsCaps()) {
    throw FormatError("framerate " + framerate.ToString() +
                      " does not fit a caps fraction");
  }
  const VideoFormatEntry& entry = LookupVideoFormat(format);

  GstVideoInfo info;
  gst_video_info_init(&info);
  if (!gst_video_info_set_format(&info, entry.id, static_cast<guint>(width),
                                 static_cast<guint>(height))) {
    throw FormatError("cannot lay out " + format + " at " +
                      std::to_string(width) + "x" + std::to_string(height));
  }
  GST_VIDEO_INFO_FPS_N(&info) = static_cast<gint>(framerate.num);
  GST_VIDEO_INFO_FPS_D(&info) = static_cast<gint>(framerate.den);
  return FormatDescriptor(FromVideoInfo(info));
}

FormatDescriptor FormatDescriptor::Audio(int32_t rate, int32_t channels,
                                         const std::string& format,
                                         size_t samples_per_channel) {
  const GstAudioFormat id = gst_audio_format_from_string(format.c_str());
  if (id == GST_AUDIO_FORMAT_UNKNOWN) {
    throw FormatError("unknown audio format '" + format + "'");
  }
  AudioFormat audio =
      FromAudioParams(rate, channels, gst_audio_format_get_info(id), 0);
  audio.samples_per_channel = samples_per_channel;
  return FormatDescriptor(std::move(audio));
}

int32_t FormatDescriptor::Channels() const {
  return IsVideo() ? video().channels : audio().channels;
}

ElementType FormatDescriptor::element_type() const {
  return IsVideo() ? video().element_type : audio().element_type;
}

const std::string& FormatDescriptor::FormatTag() const {
  return IsVideo() ? video().format : audio().format;
}

Shape FormatDescriptor::GetShape() const {
  if (IsVideo()) {
    const VideoFormat& v = video();
    return {static_cast<size_t>(v.height), static_cast<size_t>(v.width),
            static_cast<size_t>(v.channels)};
  }
  const AudioFormat& a = audio();
  return {a.samples_per_channel, static_cast<size_t>(a.channels)};
}

Shape FormatDescriptor::Squeeze(const Shape& shape) const {
  if (Channels() != 1 || shape.empty() || shape.back() != 1) return shape;
  return Shape(shape.begin(), shape.end() - 1);
}

gst::CapsPtr FormatDescriptor::ToCaps() const {
  if (IsVideo()) {
    const VideoFormat& v = video();
    return gst::CapsPtr(gst_caps_new_simple(
        "video/x-raw", "format", G_TYPE_STRING, v.format.c_str(), "width",
        G_TYPE_INT, v.width, "height", G_TYPE_INT, v.height, "framerate",
        GST_TYPE_FRACTION, static_cast<gint>(v.framerate.num),
        static_cast<gint>(v.framerate.den), NULL));
  }

  const AudioFormat& a = audio();
  gst::CapsPtr caps(gst_caps_new_simple(
      "audio/x-raw", "format", G_TYPE_STRING, a.format.c_str(), "rate",
      G_TYPE_INT, a.rate, "channels", G_TYPE_INT, a.channels, "layout",
      G_TYPE_STRING, "interleaved", NULL));
  if (a.channels > 2) {
    // Multichannel caps do not fixate downstream without a mask.
    gst_caps_set_simple(caps.get(), "channel-mask", GST_TYPE_BITMASK,
                        gst_audio_channel_get_fallback_mask(a.channels), NULL);
  }
  return caps;
}

std::string FormatDescriptor::ToString() const {
  std::ostringstream oss;
  if (IsVideo()) {
    const VideoFormat& v = video();
    oss << "video/x-raw " << v.format << " " << v.width << "x" << v.height
        << " channels=" << v.channels << " "
        << ElementTypeName(v.element_type) << " stride=" << v.row_stride
        << " framerate=" << v.framerate.ToString();
  } else {
    const AudioFormat& a = audio();
    oss << "audio/x-raw " << a.format << " rate=" << a.rate
        << " channels=" << a.channels << " " << ElementTypeName(a.element_type)
        << " samples=" << a.samples_per_channel;
  }
  return oss.str();
}

int32_t VideoChannelCount(const std::string& format) {
  return LookupVideoFormat(format).channels;
}

std::vector<std::string> SupportedVideoFormats() {
  std::vector<std::string> tags;
  for (const auto& [tag, entry] : VideoFormatTable()) {
    if (entry.array_layout) tags.push_back(tag);
  }
  return tags;
}

}  // namespace streamtap::format
