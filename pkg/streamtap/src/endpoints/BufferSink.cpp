// Repository: StreamTap
// Component: BufferSink
// Purpose: appsink sample callback, format memo and queue hand-off.
// Copyright (c) 2025 RetroVue

#include "streamtap/endpoints/BufferSink.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "streamtap/buffer/BufferCodec.hpp"
#include "streamtap/runtime/Errors.hpp"
#include "streamtap/util/Logger.hpp"

namespace streamtap::endpoints {

using streamtap::util::Logger;

namespace {

std::string ElementName(GstElement* element) {
  gst::CharPtr name(gst_element_get_name(element));
  return name ? std::string(name.get()) : std::string("appsink");
}

void LogDroppedBuffer(const buffer::Buffer& dropped) {
  if (!Logger::DebugEnabled()) return;
  std::ostringstream oss;
  oss << "[BufferSink] Queue full, dropped oldest buffer pts=";
  if (dropped.HasPts()) {
    oss << dropped.pts;
  } else {
    oss << "none";
  }
  Logger::Debug(oss.str());
}

}  // namespace

BufferSink::BufferSink(GstElement* appsink, size_t queue_capacity,
                       buffer::QueuePolicy policy)
    : element_(gst::RefElement(appsink)),
      queue_(queue_capacity, policy, &LogDroppedBuffer) {
  if (!element_ || !GST_IS_APP_SINK(element_.get())) {
    throw ConfigurationError("BufferSink requires an appsink element");
  }
  name_ = ElementName(element_.get());

  GstAppSinkCallbacks callbacks = {};
  callbacks.new_sample = &BufferSink::OnNewSample;
  gst_app_sink_set_callbacks(GST_APP_SINK(element_.get()), &callbacks, this,
                             nullptr);

  std::ostringstream oss;
  oss << "[BufferSink] Attached to '" << name_ << "' (capacity="
      << queue_capacity << ", policy=" << buffer::QueuePolicyName(policy)
      << ")";
  Logger::Debug(oss.str());
}

BufferSink::~BufferSink() {
  queue_.Close();
  GstAppSinkCallbacks none = {};
  gst_app_sink_set_callbacks(GST_APP_SINK(element_.get()), &none, nullptr,
                             nullptr);
}

GstFlowReturn BufferSink::OnNewSample(GstAppSink* appsink, gpointer user_data) {
  auto* self = static_cast<BufferSink*>(user_data);
  gst::SamplePtr sample(gst_app_sink_pull_sample(appsink));
  if (!sample) {
    Logger::Error("[BufferSink] pull-sample returned no sample on '" +
                  self->name_ + "'");
    return GST_FLOW_ERROR;
  }
  try {
    return self->HandleSample(sample.get());
  } catch (const std::exception& e) {
    // Nothing may unwind into the streaming thread.
    Logger::Error("[BufferSink] Sample handling failed on '" + self->name_ +
                  "': " + e.what());
    return GST_FLOW_ERROR;
  }
}

bool BufferSink::ResolveFromNegotiatedCaps() {
  {
    std::lock_guard<std::mutex> lock(format_mutex_);
    if (format_) return true;
  }
  gst::PadPtr pad(gst_element_get_static_pad(element_.get(), "sink"));
  if (!pad) return false;
  gst::CapsPtr caps(gst_pad_get_current_caps(pad.get()));
  if (!caps) return false;
  return EnsureFormat(caps.get(), 0).has_value();
}

std::optional<format::FormatDescriptor> BufferSink::EnsureFormat(
    const GstCaps* caps, size_t buffer_size) {
  std::lock_guard<std::mutex> lock(format_mutex_);
  if (format_) return format_;

  try {
    format_ = format::FormatDescriptor::FromCaps(caps, buffer_size);
  } catch (const FormatError& e) {
    // Unsupported caps repeat on every sample; warn once per distinct cause.
    const std::string reason = e.what();
    if (reason != last_resolve_error_) {
      Logger::Warn("[BufferSink] Cannot resolve format on '" + name_ +
                   "': " + reason);
      last_resolve_error_ = reason;
    }
    return std::nullopt;
  }

  Logger::Info("[BufferSink] '" + name_ + "' format: " + format_->ToString());
  return format_;
}

GstFlowReturn BufferSink::HandleSample(GstSample* sample) {
  GstBuffer* gst_buffer = gst_sample_get_buffer(sample);
  GstCaps* caps = gst_sample_get_caps(sample);
  if (!gst_buffer || !caps) {
    ++samples_skipped_;
    Logger::Warn("[BufferSink] Sample without " +
                 std::string(gst_buffer ? "caps" : "buffer") +
                 " on '" + name_ + "', skipping");
    return GST_FLOW_OK;
  }

  auto format = EnsureFormat(caps, gst_buffer_get_size(gst_buffer));
  if (!format) {
    ++samples_skipped_;
    return GST_FLOW_OK;
  }

  buffer::Buffer out;
  {
    gst::ScopedBufferMap map(gst_buffer, GST_MAP_READ);
    if (!map.ok()) {
      ++samples_skipped_;
      Logger::Error("[BufferSink] Failed to map buffer on '" + name_ + "'");
      return GST_FLOW_OK;
    }
    try {
      out.data = buffer::DecodeBuffer(map.data(), map.size(), *format);
    } catch (const FormatError& e) {
      ++samples_skipped_;
      Logger::Error("[BufferSink] Decode failed on '" + name_ +
                    "': " + e.what());
      return GST_FLOW_OK;
    }
  }
  out.pts = GST_BUFFER_PTS(gst_buffer);
  out.dts = GST_BUFFER_DTS(gst_buffer);
  out.duration = GST_BUFFER_DURATION(gst_buffer);
  out.offset = GST_BUFFER_OFFSET(gst_buffer);

  if (!queue_.Put(std::move(out))) {
    // Closed during shutdown; tell upstream to stop pushing.
    return GST_FLOW_FLUSHING;
  }
  return GST_FLOW_OK;
}

std::optional<buffer::Buffer> BufferSink::Pop(
    std::chrono::milliseconds timeout, const std::function<bool()>& is_active) {
  while (is_active() || !queue_.Empty()) {
    auto item = queue_.Pop(timeout);
    if (item) return item;
  }
  return std::nullopt;
}

std::optional<format::FormatDescriptor> BufferSink::Format() const {
  std::lock_guard<std::mutex> lock(format_mutex_);
  return format_;
}

}  // namespace streamtap::endpoints
