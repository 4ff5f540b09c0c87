// Repository: StreamTap
// Component: PipelineController
// Purpose: Owns one GStreamer pipeline and its GLib loop thread; moves the
//          pipeline NULL → READY → PAUSED → PLAYING, wires the appsink /
//          appsrc endpoints, and tears everything down exactly once.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_RUNTIME_PIPELINE_CONTROLLER_HPP_
#define STREAMTAP_RUNTIME_PIPELINE_CONTROLLER_HPP_

#include <gst/gst.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "streamtap/buffer/Buffer.hpp"
#include "streamtap/buffer/NDArray.hpp"
#include "streamtap/bus/BusDispatcher.hpp"
#include "streamtap/endpoints/BufferSink.hpp"
#include "streamtap/endpoints/BufferSource.hpp"
#include "streamtap/format/RationalFps.hpp"
#include "streamtap/gst/GstPtr.hpp"
#include "streamtap/runtime/ControllerState.hpp"
#include "streamtap/runtime/PipelineConfig.hpp"

namespace streamtap::runtime {

// PipelineController runs one pipeline described in gst-launch syntax.
//
// Threads:
//   - application thread(s): Startup(), Pop(), Push(), Shutdown()
//   - loop thread: private GMainContext; bus messages and interrupt
//     signals are handled here
//   - engine streaming threads: appsink callbacks (BufferSink)
//
// Lifecycle:
//   1. Construct (no I/O, no threads)
//   2. Startup(): parse, wire endpoints, PLAYING
//   3. Pop()/Push() until !HasMoreWork()
//   4. Shutdown(), or let the destructor do it
//
// A bus error or EOS shuts the pipeline down from the loop thread. Buffers
// already queued stay poppable after that, so a consumer loop of the form
//   while (controller) { if (auto b = controller.Pop()) ... }
// sees every delivered buffer before it exits.
//
// A stopped controller cannot be restarted; build a new one.
class PipelineController : public bus::BusEventHandler {
 public:
  explicit PipelineController(PipelineConfig config);
  explicit PipelineController(const std::string& description);
  ~PipelineController() override;

  PipelineController(const PipelineController&) = delete;
  PipelineController& operator=(const PipelineController&) = delete;

  // --- Lifecycle ---

  // Throws ConfigurationError on a bad description, more than one appsink
  // or appsrc, or a controller that already stopped. On failure the
  // controller is torn down to kStopped before the exception propagates.
  void Startup();

  // Idempotent and safe from any thread, including bus callbacks. The first
  // caller tears down (EOS wait, then grace wait, then NULL); concurrent
  // callers block until kStopped, except on the loop thread. With send_eos
  // an appsrc gets end-of-stream after its queued pushes and every other
  // source gets an EOS event.
  void Shutdown(bool send_eos = false,
                std::chrono::milliseconds timeout =
                    std::chrono::milliseconds(1000)) noexcept;

  // Shuts down as if SIGINT had arrived. Does not block.
  void RequestInterrupt();

  // --- Data ---

  // Next buffer from the appsink queue. Blocks in `timeout` slices while
  // the pipeline runs; returns nullopt once stopped and drained.
  // Throws ConfigurationError (after requesting shutdown) with no appsink.
  std::optional<buffer::Buffer> Pop(
      std::chrono::milliseconds timeout = std::chrono::milliseconds(100));

  // Throws ConfigurationError (after requesting shutdown) with no appsrc,
  // FormatError when the array does not match the source format. Returns
  // false when the engine refused the buffer.
  bool Push(buffer::NDArray array);

  // Sets appsrc caps. Returns false (logged) with no appsrc or when caps
  // are already set. Throws FormatError on bad parameters.
  bool SetSourceVideoFormat(int32_t width, int32_t height,
                            format::RationalFps framerate,
                            const std::string& format = "RGB");
  bool SetSourceVideoFormat(const endpoints::SourceVideoFormat& video);

  // --- Introspection ---

  // True until kStopped, and afterwards while queued buffers remain.
  bool HasMoreWork() const;
  explicit operator bool() const { return HasMoreWork(); }

  [[nodiscard]] ControllerState State() const { return state_.load(); }
  const char* StateName() const { return ControllerStateName(State()); }
  // GStreamer's view; GST_STATE_NULL when there is no pipeline.
  GstState EngineState() const;
  bool IsActive() const;
  bool IsDone() const { return stopping_.load(); }

  // Extra reference to a named element, or null.
  gst::ElementPtr GetByName(const std::string& name) const;
  std::vector<std::string> Elements() const;

  bool HasSink() const;
  bool HasSource() const;
  size_t SinkQueueSize() const;
  uint64_t SinkDropped() const;

  const PipelineConfig& config() const { return config_; }
  std::string ToString() const;

 protected:
  // Bus reactions; all run on the loop thread.
  void OnBusError(const bus::BusError& error) override;
  void OnBusEndOfStream() override;

 private:
  struct Endpoints {
    std::vector<gst::ElementPtr> sinks;
    std::vector<gst::ElementPtr> sources;
  };

  void BuildPipeline();
  Endpoints EnumerateElements();
  void WireEndpoints();
  void ChangeEngineState(GstState target);
  void WaitForPreroll();
  // Moves to `next` unless a shutdown has begun. Returns false if refused.
  bool AdvanceState(ControllerState next);

  void RunMainLoop();
  void QuitMainLoop();
  void InstallInterruptHandlers();
  static gboolean OnInterruptSignal(gpointer user_data);
  static gboolean OnScheduledShutdown(gpointer user_data);

  void Teardown(bool send_eos, std::chrono::milliseconds timeout);
  void SendEndOfStreamAndWait(std::chrono::milliseconds timeout);
  void MarkStopped();
  void WaitUntilStopped();
  void JoinLoopThread();
  bool OnLoopThread() const;
  // Asks the loop thread to shut down; inline when no loop runs.
  void ScheduleShutdown();

  std::shared_ptr<endpoints::BufferSink> Sink() const;
  std::shared_ptr<endpoints::BufferSource> Source() const;

  const PipelineConfig config_;

  std::atomic<ControllerState> state_{ControllerState::kNull};
  std::atomic<bool> stopping_{false};

  // Serializes Startup() against the release step of teardown.
  mutable std::mutex lifecycle_mutex_;
  gst::ElementPtr pipeline_;
  std::vector<std::string> element_names_;
  std::unique_ptr<bus::BusDispatcher> dispatcher_;

  mutable std::mutex endpoint_mutex_;
  std::shared_ptr<endpoints::BufferSink> sink_;
  std::shared_ptr<endpoints::BufferSource> source_;

  gst::MainContextPtr context_;
  gst::MainLoopPtr loop_;
  std::atomic<bool> loop_started_{false};
  std::vector<gst::SourcePtr> signal_sources_;

  std::mutex thread_mutex_;
  std::thread loop_thread_;
  std::atomic<std::thread::id> loop_thread_id_{};

  std::mutex stopped_mutex_;
  std::condition_variable stopped_cv_;

  std::mutex eos_mutex_;
  std::condition_variable eos_cv_;
  bool eos_received_ = false;
};

}  // namespace streamtap::runtime

#endif  // STREAMTAP_RUNTIME_PIPELINE_CONTROLLER_HPP_
