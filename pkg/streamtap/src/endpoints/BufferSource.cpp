// Repository: StreamTap
// Component: BufferSource
// Purpose: appsrc configuration, caps and timestamped pushes.
// Copyright (c) 2025 RetroVue

#include "streamtap/endpoints/BufferSource.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "streamtap/buffer/Buffer.hpp"
#include "streamtap/buffer/BufferCodec.hpp"
#include "streamtap/runtime/Errors.hpp"
#include "streamtap/util/Logger.hpp"

namespace streamtap::endpoints {

using streamtap::util::Logger;

namespace {

using Storage = std::vector<uint8_t>;

void FreeStorage(gpointer storage) {
  std::unique_ptr<Storage> owned(static_cast<Storage*>(storage));
}

// Hands `bytes` to a GstBuffer without copying; the buffer frees them.
gst::BufferPtr WrapBytes(std::vector<uint8_t> bytes) {
  if (bytes.empty()) return gst::BufferPtr(gst_buffer_new());
  auto storage = std::make_unique<Storage>(std::move(bytes));
  gst::BufferPtr wrapped(gst_buffer_new_wrapped_full(
      GST_MEMORY_FLAG_READONLY, storage->data(), storage->size(), 0,
      storage->size(), storage.get(), &FreeStorage));
  if (!wrapped) {
    throw FormatError("cannot wrap " + std::to_string(storage->size()) +
                      " bytes in a buffer");
  }
  // The buffer's destroy notify owns the storage from here on.
  storage.release();
  return wrapped;
}

}  // namespace

BufferSource::BufferSource(GstElement* appsrc)
    : element_(gst::RefElement(appsrc)) {
  if (!element_ || !GST_IS_APP_SRC(element_.get())) {
    throw ConfigurationError("BufferSource requires an appsrc element");
  }
  gst::CharPtr name(gst_element_get_name(element_.get()));
  name_ = name ? name.get() : "appsrc";

  g_object_set(element_.get(), "format", GST_FORMAT_TIME, "block", TRUE, NULL);

  gst::CapsPtr caps(gst_app_src_get_caps(GST_APP_SRC(element_.get())));
  if (!caps) return;
  try {
    format_ = format::FormatDescriptor::FromCaps(caps.get(), 0);
    Logger::Info("[BufferSource] '" + name_ + "' format from element caps: " +
                 format_->ToString());
  } catch (const FormatError& e) {
    Logger::Warn("[BufferSource] Caps on '" + name_ +
                 "' cannot carry arrays: " + e.what());
  }
}

bool BufferSource::SetVideoFormat(const SourceVideoFormat& video) {
  std::lock_guard<std::mutex> lock(mutex_);
  gst::CapsPtr existing(gst_app_src_get_caps(GST_APP_SRC(element_.get())));
  if (format_ || existing) {
    Logger::Warn("[BufferSource] '" + name_ +
                 "' already has caps; ignoring explicit video format");
    return false;
  }
  if (!video.framerate.IsValid()) {
    throw FormatError("source framerate must be positive");
  }

  format::FormatDescriptor descriptor = format::FormatDescriptor::Video(
      video.width, video.height, video.format, video.framerate);
  gst::CapsPtr caps = descriptor.ToCaps();
  gst_app_src_set_caps(GST_APP_SRC(element_.get()), caps.get());
  format_ = std::move(descriptor);

  Logger::Info("[BufferSource] '" + name_ + "' caps set: " +
               gst::CapsToString(caps.get()));
  return true;
}

bool BufferSource::Push(buffer::NDArray array) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!format_) {
    throw FormatError("appsrc '" + name_ +
                      "' has no caps; set them in the pipeline description "
                      "or call SetSourceVideoFormat()");
  }

  uint64_t pts = buffer::kTimeUnset;
  uint64_t duration = buffer::kTimeUnset;
  uint64_t samples = 0;
  if (format_->IsVideo()) {
    const format::RationalFps& fps = format_->video().framerate;
    if (fps.IsValid()) {
      pts = fps.DurationFromFramesNs(buffer_index_);
      duration = fps.FrameDurationNs();
    }
  } else {
    const uint64_t rate = static_cast<uint64_t>(format_->audio().rate);
    samples = array.shape().empty() ? 0 : array.shape()[0];
    pts = gst_util_uint64_scale(samples_pushed_, GST_SECOND, rate);
    duration = gst_util_uint64_scale(samples, GST_SECOND, rate);
  }

  gst::BufferPtr out = WrapBytes(buffer::EncodeArray(std::move(array), *format_));
  GST_BUFFER_PTS(out.get()) = pts;
  GST_BUFFER_DTS(out.get()) = GST_CLOCK_TIME_NONE;
  GST_BUFFER_DURATION(out.get()) = duration;
  GST_BUFFER_OFFSET(out.get()) = buffer_index_;

  // push_buffer takes ownership.
  const GstFlowReturn ret =
      gst_app_src_push_buffer(GST_APP_SRC(element_.get()), out.release());
  if (ret != GST_FLOW_OK) {
    std::ostringstream oss;
    oss << "[BufferSource] Push " << buffer_index_ << " to '" << name_
        << "' refused: " << gst_flow_get_name(ret);
    if (ret == GST_FLOW_FLUSHING || ret == GST_FLOW_EOS) {
      Logger::Debug(oss.str());
    } else {
      Logger::Warn(oss.str());
    }
    return false;
  }

  ++buffer_index_;
  samples_pushed_ += samples;
  return true;
}

bool BufferSource::EndOfStream() {
  return gst_app_src_end_of_stream(GST_APP_SRC(element_.get())) == GST_FLOW_OK;
}

std::optional<format::FormatDescriptor> BufferSource::Format() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return format_;
}

bool BufferSource::HasFormat() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return format_.has_value();
}

uint64_t BufferSource::BuffersPushed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_index_;
}

}  // namespace streamtap::endpoints
