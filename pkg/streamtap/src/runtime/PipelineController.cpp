// Repository: StreamTap
// Component: PipelineController
// Purpose: Startup wiring, loop thread, bus reactions and one-shot teardown.
// Copyright (c) 2025 RetroVue

#include "streamtap/runtime/PipelineController.hpp"

#include <gst/app/gstappsink.h>
#include <gst/app/gstappsrc.h>
#include <glib-unix.h>

#include <csignal>
#include <sstream>
#include <utility>

#include "streamtap/gst/GstInit.hpp"
#include "streamtap/runtime/Errors.hpp"
#include "streamtap/util/Logger.hpp"

namespace streamtap::runtime {

using streamtap::util::Logger;

namespace {

gboolean QuitLoopCallback(gpointer loop) {
  g_main_loop_quit(static_cast<GMainLoop*>(loop));
  return G_SOURCE_REMOVE;
}

std::string NameOf(GstElement* element) {
  gst::CharPtr name(gst_element_get_name(element));
  return name ? std::string(name.get()) : std::string();
}

// EOS for every top-level source except the appsrc. A bin holding sources
// carries the source flag and forwards the event to them itself.
void SendEosToOtherSources(GstElement* pipeline) {
  GstIterator* it = gst_bin_iterate_sources(GST_BIN(pipeline));
  GValue item = G_VALUE_INIT;
  bool done = false;
  while (!done) {
    switch (gst_iterator_next(it, &item)) {
      case GST_ITERATOR_OK: {
        auto* element = GST_ELEMENT(g_value_get_object(&item));
        if (!GST_IS_APP_SRC(element) &&
            !gst_element_send_event(element, gst_event_new_eos())) {
          Logger::Warn("[PipelineController] EOS event not handled by " +
                       NameOf(element));
        }
        g_value_reset(&item);
        break;
      }
      case GST_ITERATOR_RESYNC:
        gst_iterator_resync(it);
        break;
      case GST_ITERATOR_ERROR:
      case GST_ITERATOR_DONE:
        done = true;
        break;
    }
  }
  g_value_unset(&item);
  gst_iterator_free(it);
}

}  // namespace

PipelineController::PipelineController(PipelineConfig config)
    : config_(std::move(config)),
      dispatcher_(std::make_unique<bus::BusDispatcher>(*this)) {
  if (config_.queue_capacity == 0) {
    throw ConfigurationError("queue_capacity must be at least 1");
  }
}

PipelineController::PipelineController(const std::string& description)
    : PipelineController(PipelineConfig(description)) {}

PipelineController::~PipelineController() {
  Shutdown(false, config_.shutdown_timeout);
}

// ============================================================================
// Startup
// ============================================================================

void PipelineController::Startup() {
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  if (stopping_.load()) {
    throw ConfigurationError(
        std::string("controller is ") + StateName() +
        "; a stopped PipelineController cannot be restarted");
  }
  if (loop_started_.load() || pipeline_) {
    Logger::Warn("[PipelineController] Startup() called while already running");
    return;
  }

  gst::EnsureInitialized();

  Logger::Info("[PipelineController] Starting main loop thread");
  context_.reset(g_main_context_new());
  loop_.reset(g_main_loop_new(context_.get(), FALSE));
  if (config_.handle_interrupts) InstallInterruptHandlers();
  {
    std::lock_guard<std::mutex> thread_lock(thread_mutex_);
    loop_thread_ = std::thread(&PipelineController::RunMainLoop, this);
  }
  loop_started_ = true;

  try {
    BuildPipeline();
    Endpoints endpoints = EnumerateElements();

    gst::BusPtr bus(gst_element_get_bus(pipeline_.get()));
    dispatcher_->Attach(bus.get(), context_.get(), pipeline_.get());

    ChangeEngineState(GST_STATE_READY);
    if (!AdvanceState(ControllerState::kReady)) return;

    ChangeEngineState(GST_STATE_PAUSED);
    if (endpoints.sources.empty()) WaitForPreroll();
    if (!AdvanceState(ControllerState::kPaused)) return;

    WireEndpoints();

    ChangeEngineState(GST_STATE_PLAYING);
    if (!AdvanceState(ControllerState::kPlaying)) return;
  } catch (const StreamTapError& e) {
    Logger::Error(std::string("[PipelineController] Startup failed: ") +
                  e.what());
    lock.unlock();
    Shutdown(false, std::chrono::milliseconds(0));
    throw;
  }

  Logger::Info("[PipelineController] Pipeline started");
}

void PipelineController::BuildPipeline() {
  std::ostringstream oss;
  oss << "[PipelineController] Parsing pipeline: " << config_.description;
  Logger::Info(oss.str());

  // FATAL_ERRORS: a missing element or unlinkable pad fails startup instead
  // of leaving a partial graph.
  GError* raw_err = nullptr;
  GstElement* parsed =
      gst_parse_launch_full(config_.description.c_str(), nullptr,
                            GST_PARSE_FLAG_FATAL_ERRORS, &raw_err);
  gst::ErrorPtr err(raw_err);
  if (parsed && g_object_is_floating(parsed)) gst_object_ref_sink(parsed);
  gst::ElementPtr element(parsed);
  if (!element || err) {
    throw ConfigurationError("cannot parse pipeline '" + config_.description +
                             "': " + gst::ErrorMessage(err.get()));
  }

  if (GST_IS_PIPELINE(element.get())) {
    pipeline_ = std::move(element);
    return;
  }
  // A lone element parses to itself; give it a pipeline to live in.
  GstElement* pipeline = gst_pipeline_new(nullptr);
  gst_object_ref_sink(pipeline);
  pipeline_.reset(pipeline);
  gst_bin_add(GST_BIN(pipeline_.get()), element.get());
}

PipelineController::Endpoints PipelineController::EnumerateElements() {
  Endpoints found;
  element_names_.clear();

  GstIterator* it = gst_bin_iterate_recurse(GST_BIN(pipeline_.get()));
  GValue item = G_VALUE_INIT;
  bool done = false;
  while (!done) {
    switch (gst_iterator_next(it, &item)) {
      case GST_ITERATOR_OK: {
        auto* element = GST_ELEMENT(g_value_get_object(&item));
        element_names_.push_back(NameOf(element));
        if (GST_IS_APP_SINK(element)) {
          found.sinks.push_back(gst::RefElement(element));
        } else if (GST_IS_APP_SRC(element)) {
          found.sources.push_back(gst::RefElement(element));
        }
        g_value_reset(&item);
        break;
      }
      case GST_ITERATOR_RESYNC:
        gst_iterator_resync(it);
        found = Endpoints();
        element_names_.clear();
        break;
      case GST_ITERATOR_ERROR:
      case GST_ITERATOR_DONE:
        done = true;
        break;
    }
  }
  g_value_unset(&item);
  gst_iterator_free(it);

  if (found.sinks.size() > 1 || found.sources.size() > 1) {
    std::ostringstream oss;
    oss << "pipeline has " << found.sinks.size() << " appsink(s) and "
        << found.sources.size() << " appsrc(s); at most one of each is "
        << "supported";
    throw ConfigurationError(oss.str());
  }

  // Endpoints are built before READY: appsrc's format property only takes
  // effect if set before the element starts.
  if (!found.sinks.empty()) {
    auto sink = std::make_shared<endpoints::BufferSink>(
        found.sinks.front().get(), config_.queue_capacity, config_.queue_policy);
    Logger::Info("[PipelineController] Found appsink '" + sink->name() + "'");
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    sink_ = std::move(sink);
  }
  if (!found.sources.empty()) {
    auto source =
        std::make_shared<endpoints::BufferSource>(found.sources.front().get());
    Logger::Info("[PipelineController] Found appsrc '" + source->name() + "'");
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    source_ = std::move(source);
  }
  if (found.sinks.empty() && found.sources.empty()) {
    Logger::Debug("[PipelineController] No appsink or appsrc in pipeline");
  }
  return found;
}

void PipelineController::WireEndpoints() {
  if (auto sink = Sink()) {
    if (!sink->ResolveFromNegotiatedCaps()) {
      Logger::Debug(
          "[PipelineController] appsink caps not negotiated yet; resolving on "
          "first sample");
    }
  }
  if (auto source = Source()) {
    if (config_.source_format) {
      source->SetVideoFormat(*config_.source_format);
    } else if (!source->HasFormat()) {
      Logger::Info(
          "[PipelineController] appsrc has no caps yet; call "
          "SetSourceVideoFormat() before pushing");
    }
  }
}

void PipelineController::ChangeEngineState(GstState target) {
  const GstStateChangeReturn ret =
      gst_element_set_state(pipeline_.get(), target);
  if (ret == GST_STATE_CHANGE_FAILURE) {
    // The bus carries the cause and drives shutdown.
    Logger::Error(std::string("[PipelineController] Failed to set pipeline to ") +
                  gst_element_state_get_name(target));
  }
}

void PipelineController::WaitForPreroll() {
  GstState current = GST_STATE_VOID_PENDING;
  GstState pending = GST_STATE_VOID_PENDING;
  const GstClockTime timeout =
      static_cast<GstClockTime>(config_.preroll_timeout.count()) * GST_MSECOND;
  const GstStateChangeReturn ret =
      gst_element_get_state(pipeline_.get(), &current, &pending, timeout);

  switch (ret) {
    case GST_STATE_CHANGE_SUCCESS:
    case GST_STATE_CHANGE_NO_PREROLL:
      Logger::Debug("[PipelineController] Preroll complete");
      break;
    case GST_STATE_CHANGE_ASYNC: {
      std::ostringstream oss;
      oss << "[PipelineController] Preroll not finished after "
          << config_.preroll_timeout.count() << " ms; continuing";
      Logger::Warn(oss.str());
      break;
    }
    case GST_STATE_CHANGE_FAILURE:
      Logger::Error("[PipelineController] Preroll failed");
      break;
  }
}

bool PipelineController::AdvanceState(ControllerState next) {
  ControllerState current = state_.load();
  while (current != ControllerState::kStopping &&
         current != ControllerState::kStopped) {
    if (state_.compare_exchange_weak(current, next)) {
      Logger::Debug(std::string("[PipelineController] State ") +
                    ControllerStateName(current) + " -> " +
                    ControllerStateName(next));
      return true;
    }
  }
  Logger::Info(std::string("[PipelineController] Shutdown in progress; not "
                           "entering ") +
               ControllerStateName(next));
  return false;
}

// ============================================================================
// Loop thread
// ============================================================================

void PipelineController::RunMainLoop() {
  loop_thread_id_.store(std::this_thread::get_id());
  g_main_context_push_thread_default(context_.get());
  Logger::Debug("[PipelineController] Main loop running");
  g_main_loop_run(loop_.get());
  g_main_context_pop_thread_default(context_.get());
  Logger::Debug("[PipelineController] Main loop exited");
}

void PipelineController::QuitMainLoop() {
  if (!loop_) return;
  // g_main_loop_quit() is lost if the loop has not entered run() yet; the
  // idle source covers that window.
  GSource* idle = g_idle_source_new();
  g_source_set_callback(idle, &QuitLoopCallback, loop_.get(), nullptr);
  g_source_attach(idle, context_.get());
  g_source_unref(idle);
  g_main_loop_quit(loop_.get());
}

bool PipelineController::OnLoopThread() const {
  return loop_thread_id_.load() == std::this_thread::get_id();
}

void PipelineController::InstallInterruptHandlers() {
  for (int signum : {SIGINT, SIGTERM}) {
    gst::SourcePtr source(g_unix_signal_source_new(signum));
    g_source_set_callback(source.get(), &PipelineController::OnInterruptSignal,
                          this, nullptr);
    g_source_attach(source.get(), context_.get());
    signal_sources_.push_back(std::move(source));
  }
  Logger::Debug("[PipelineController] SIGINT/SIGTERM handlers installed");
}

gboolean PipelineController::OnInterruptSignal(gpointer user_data) {
  Logger::Warn("[PipelineController] Interrupt received");
  static_cast<PipelineController*>(user_data)->RequestInterrupt();
  return G_SOURCE_CONTINUE;
}

gboolean PipelineController::OnScheduledShutdown(gpointer user_data) {
  auto* self = static_cast<PipelineController*>(user_data);
  self->Shutdown(false, self->config_.shutdown_timeout);
  return G_SOURCE_REMOVE;
}

void PipelineController::RequestInterrupt() { ScheduleShutdown(); }

void PipelineController::ScheduleShutdown() {
  if (stopping_.load()) return;
  if (!loop_started_.load()) {
    Shutdown(false, std::chrono::milliseconds(0));
    return;
  }
  g_main_context_invoke(context_.get(), &PipelineController::OnScheduledShutdown,
                        this);
}

// ============================================================================
// Bus reactions
// ============================================================================

void PipelineController::OnBusError(const bus::BusError& error) {
  Logger::Error("[PipelineController] Engine error from '" + error.source +
                "'; shutting down");
  Shutdown(false, config_.shutdown_timeout);
}

void PipelineController::OnBusEndOfStream() {
  {
    std::lock_guard<std::mutex> lock(eos_mutex_);
    eos_received_ = true;
  }
  eos_cv_.notify_all();
  Shutdown(false, config_.shutdown_timeout);
}

// ============================================================================
// Shutdown
// ============================================================================

void PipelineController::Shutdown(bool send_eos,
                                  std::chrono::milliseconds timeout) noexcept {
  bool expected = false;
  if (!stopping_.compare_exchange_strong(expected, true)) {
    // The loop thread must never wait on its own teardown.
    if (!OnLoopThread()) {
      WaitUntilStopped();
      JoinLoopThread();
    }
    return;
  }

  try {
    Teardown(send_eos, timeout);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[PipelineController] Teardown error: ") +
                  e.what());
  }
  MarkStopped();
  if (!OnLoopThread()) JoinLoopThread();
}

void PipelineController::Teardown(bool send_eos,
                                  std::chrono::milliseconds timeout) {
  const ControllerState prior = state_.exchange(ControllerState::kStopping);
  {
    // Startup() holds this lock until it has either started the loop or
    // refused; after that, loop_started_ is stable.
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!loop_started_.load()) {
      Logger::Debug("[PipelineController] Shutdown before startup");
      return;
    }
  }

  std::ostringstream oss;
  oss << "[PipelineController] Shutdown requested (state="
      << ControllerStateName(prior) << ", send_eos=" << (send_eos ? "yes" : "no")
      << ", timeout=" << timeout.count() << "ms)";
  Logger::Info(oss.str());

  if (send_eos && prior == ControllerState::kPlaying) {
    SendEndOfStreamAndWait(timeout);
  }

  // Grace period for in-flight buffers.
  if (timeout.count() > 0) std::this_thread::sleep_for(timeout);

  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    // Release a streaming thread blocked on a full queue before NULL, or
    // the state change waits on it forever.
    if (auto sink = Sink()) sink->Close();
    if (pipeline_) {
      if (gst_element_set_state(pipeline_.get(), GST_STATE_NULL) ==
          GST_STATE_CHANGE_FAILURE) {
        Logger::Error("[PipelineController] Failed to set pipeline to NULL");
      }
      dispatcher_->Detach();
      pipeline_.reset();
    }
    signal_sources_.clear();
  }

  QuitMainLoop();
  Logger::Info("[PipelineController] Shutdown success");
}

void PipelineController::SendEndOfStreamAndWait(
    std::chrono::milliseconds timeout) {
  {
    std::lock_guard<std::mutex> lock(eos_mutex_);
    if (eos_received_) return;
  }

  gst::ElementPtr pipeline;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    pipeline = gst::RefElement(pipeline_.get());
  }
  if (!pipeline) return;

  // An appsrc finishes its queued pushes before EOS. Any other source in
  // the same graph still needs the event, or the pipeline never drains.
  if (auto source = Source()) {
    source->EndOfStream();
    SendEosToOtherSources(pipeline.get());
  } else if (!gst_element_send_event(pipeline.get(), gst_event_new_eos())) {
    Logger::Warn("[PipelineController] EOS event not handled");
    return;
  }

  if (OnLoopThread()) {
    // The EOS message can only be dispatched once this callback returns.
    return;
  }
  std::unique_lock<std::mutex> lock(eos_mutex_);
  if (!eos_cv_.wait_for(lock, timeout, [this] { return eos_received_; })) {
    std::ostringstream oss;
    oss << "[PipelineController] EOS not received within " << timeout.count()
        << " ms";
    Logger::Warn(oss.str());
  }
}

void PipelineController::MarkStopped() {
  {
    std::lock_guard<std::mutex> lock(stopped_mutex_);
    state_.store(ControllerState::kStopped);
  }
  stopped_cv_.notify_all();
}

void PipelineController::WaitUntilStopped() {
  std::unique_lock<std::mutex> lock(stopped_mutex_);
  stopped_cv_.wait(lock, [this] {
    return state_.load() == ControllerState::kStopped;
  });
}

void PipelineController::JoinLoopThread() {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (loop_thread_.joinable()) loop_thread_.join();
}

// ============================================================================
// Data
// ============================================================================

std::optional<buffer::Buffer> PipelineController::Pop(
    std::chrono::milliseconds timeout) {
  auto sink = Sink();
  if (!sink) {
    Logger::Error("[PipelineController] No appsink to pop buffers from");
    ScheduleShutdown();
    throw ConfigurationError("pipeline has no appsink; Pop() needs one");
  }
  return sink->Pop(timeout, [this]() {
    return state_.load() != ControllerState::kStopped;
  });
}

bool PipelineController::Push(buffer::NDArray array) {
  auto source = Source();
  if (!source) {
    Logger::Error("[PipelineController] No appsrc to push buffers to");
    ScheduleShutdown();
    throw ConfigurationError("pipeline has no appsrc; Push() needs one");
  }
  return source->Push(std::move(array));
}

bool PipelineController::SetSourceVideoFormat(int32_t width, int32_t height,
                                              format::RationalFps framerate,
                                              const std::string& format) {
  endpoints::SourceVideoFormat video;
  video.width = width;
  video.height = height;
  video.framerate = framerate;
  video.format = format;
  return SetSourceVideoFormat(video);
}

bool PipelineController::SetSourceVideoFormat(
    const endpoints::SourceVideoFormat& video) {
  auto source = Source();
  if (!source) {
    Logger::Warn("[PipelineController] No appsrc; ignoring source video format");
    return false;
  }
  return source->SetVideoFormat(video);
}

// ============================================================================
// Introspection
// ============================================================================

bool PipelineController::HasMoreWork() const {
  if (state_.load() != ControllerState::kStopped) return true;
  auto sink = Sink();
  return sink && !sink->QueueEmpty();
}

GstState PipelineController::EngineState() const {
  gst::ElementPtr pipeline;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    pipeline = gst::RefElement(pipeline_.get());
  }
  if (!pipeline) return GST_STATE_NULL;
  GstState current = GST_STATE_NULL;
  gst_element_get_state(pipeline.get(), &current, nullptr, 100 * GST_MSECOND);
  return current;
}

bool PipelineController::IsActive() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return pipeline_ && !stopping_.load();
}

gst::ElementPtr PipelineController::GetByName(const std::string& name) const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!pipeline_) return nullptr;
  return gst::ElementPtr(
      gst_bin_get_by_name(GST_BIN(pipeline_.get()), name.c_str()));
}

std::vector<std::string> PipelineController::Elements() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return element_names_;
}

bool PipelineController::HasSink() const { return Sink() != nullptr; }

bool PipelineController::HasSource() const { return Source() != nullptr; }

size_t PipelineController::SinkQueueSize() const {
  auto sink = Sink();
  return sink ? sink->QueueSize() : 0;
}

uint64_t PipelineController::SinkDropped() const {
  auto sink = Sink();
  return sink ? sink->Dropped() : 0;
}

std::string PipelineController::ToString() const {
  return std::string("PipelineController(") + StateName() + ")";
}

std::shared_ptr<endpoints::BufferSink> PipelineController::Sink() const {
  std::lock_guard<std::mutex> lock(endpoint_mutex_);
  return sink_;
}

std::shared_ptr<endpoints::BufferSource> PipelineController::Source() const {
  std::lock_guard<std::mutex> lock(endpoint_mutex_);
  return source_;
}

}  // namespace streamtap::runtime
