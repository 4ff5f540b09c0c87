// Repository: StreamTap
// Component: BufferSink
// Purpose: appsink endpoint. Decodes samples on the streaming thread and
//          hands them to the application through a BackpressureQueue.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_ENDPOINTS_BUFFER_SINK_HPP_
#define STREAMTAP_ENDPOINTS_BUFFER_SINK_HPP_

#include <gst/app/gstappsink.h>
#include <gst/gst.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "streamtap/buffer/BackpressureQueue.hpp"
#include "streamtap/buffer/Buffer.hpp"
#include "streamtap/format/FormatDescriptor.hpp"
#include "streamtap/gst/GstPtr.hpp"

namespace streamtap::endpoints {

// BufferSink wraps the pipeline's single appsink.
//
// Streaming thread: HandleSample() resolves the format on first use
// (memoized), decodes into a packed array, and Put()s it. Under the
// blocking policy a full queue stalls the streaming thread, which is how
// backpressure reaches the engine. Samples that arrive before caps are
// known, or whose format cannot be decoded, are logged and skipped.
//
// Application thread: Pop() drains the queue.
//
// Close() releases a streaming thread stuck in Put(); do it before taking
// the pipeline to NULL or the state change deadlocks.
class BufferSink {
 public:
  // Takes its own reference on `appsink` and installs the sample callback.
  // Throws ConfigurationError if the element is not an appsink.
  BufferSink(GstElement* appsink, size_t queue_capacity,
             buffer::QueuePolicy policy);
  ~BufferSink();

  BufferSink(const BufferSink&) = delete;
  BufferSink& operator=(const BufferSink&) = delete;

  // Resolves the format from the sink pad's current caps if it is not
  // resolved yet. Returns true when a format is known afterwards.
  bool ResolveFromNegotiatedCaps();

  // Entry point for the appsink callback; public so tests can feed
  // samples directly. `sample` is borrowed.
  GstFlowReturn HandleSample(GstSample* sample);

  // Pops until a buffer arrives or the pipeline is finished and the queue
  // is empty: keeps waiting in `timeout` slices while `is_active()` is true
  // or items remain.
  std::optional<buffer::Buffer> Pop(std::chrono::milliseconds timeout,
                                    const std::function<bool()>& is_active);

  void Close() { queue_.Close(); }

  std::optional<format::FormatDescriptor> Format() const;
  size_t QueueSize() const { return queue_.Size(); }
  bool QueueEmpty() const { return queue_.Empty(); }
  uint64_t Dropped() const { return queue_.Dropped(); }
  uint64_t SamplesSkipped() const { return samples_skipped_.load(); }
  uint64_t SamplesQueued() const { return queue_.TotalPushed(); }
  const std::string& name() const { return name_; }

 private:
  static GstFlowReturn OnNewSample(GstAppSink* appsink, gpointer user_data);

  // Returns the memoized format, resolving it from `caps` on first call.
  std::optional<format::FormatDescriptor> EnsureFormat(const GstCaps* caps,
                                                       size_t buffer_size);

  gst::ElementPtr element_;
  std::string name_;
  buffer::BackpressureQueue<buffer::Buffer> queue_;

  mutable std::mutex format_mutex_;
  std::optional<format::FormatDescriptor> format_;
  std::string last_resolve_error_;

  std::atomic<uint64_t> samples_skipped_{0};
};

}  // namespace streamtap::endpoints

#endif  // STREAMTAP_ENDPOINTS_BUFFER_SINK_HPP_
