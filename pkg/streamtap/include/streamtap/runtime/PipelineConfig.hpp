// Repository: StreamTap
// Component: PipelineConfig
// Purpose: Construction-time settings for a PipelineController.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_RUNTIME_PIPELINE_CONFIG_HPP_
#define STREAMTAP_RUNTIME_PIPELINE_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "streamtap/buffer/BackpressureQueue.hpp"
#include "streamtap/endpoints/BufferSource.hpp"

namespace streamtap::runtime {

struct PipelineConfig {
  PipelineConfig() = default;
  explicit PipelineConfig(std::string desc) : description(std::move(desc)) {}

  // gst-launch syntax, e.g. "videotestsrc num-buffers=10 ! appsink".
  std::string description;

  // Application-side queue behind the appsink.
  size_t queue_capacity = 100;
  buffer::QueuePolicy queue_policy = buffer::QueuePolicy::kBlock;

  // Default grace period for destructor and bus-triggered shutdowns.
  std::chrono::milliseconds shutdown_timeout{1000};

  // Upper bound on the wait for PAUSED preroll during Startup(). Skipped
  // when the pipeline has an appsrc, which cannot preroll before the
  // application pushes.
  std::chrono::milliseconds preroll_timeout{1000};

  // Caps for an appsrc that has none in the description. Caps set on the
  // element itself win.
  std::optional<endpoints::SourceVideoFormat> source_format;

  // SIGINT/SIGTERM shut the pipeline down through the loop while it runs.
  // Turn off when the host process owns those signals.
  bool handle_interrupts = true;
};

}  // namespace streamtap::runtime

#endif  // STREAMTAP_RUNTIME_PIPELINE_CONFIG_HPP_
