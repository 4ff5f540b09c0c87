// Repository: StreamTap
// Component: BusDispatcher
// Purpose: Translates GstBus messages into BusEventHandler calls on the
//          controller's GLib main-loop thread.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_BUS_BUS_DISPATCHER_HPP_
#define STREAMTAP_BUS_BUS_DISPATCHER_HPP_

#include <gst/gst.h>

#include <atomic>
#include <cstdint>
#include <string>

#include "streamtap/gst/GstPtr.hpp"

namespace streamtap::bus {

// Parsed GST_MESSAGE_ERROR / GST_MESSAGE_WARNING.
struct BusError {
  std::string source;   // posting element's name
  std::string domain;   // GError quark, e.g. "gst-stream-error-quark"
  int code = 0;
  std::string message;
  std::string debug;    // may be empty
};

// Receiver for engine events. Every call arrives on the main-loop thread.
class BusEventHandler {
 public:
  virtual ~BusEventHandler() = default;

  virtual void OnBusError(const BusError& error) = 0;
  virtual void OnBusEndOfStream() = 0;

  virtual void OnBusWarning(const BusError& /*warning*/) {}
  // Application-defined element messages; the structure is borrowed.
  virtual void OnBusElement(const std::string& /*source*/,
                            const GstStructure* /*structure*/) {}
  // Only for transitions of the top-level pipeline.
  virtual void OnBusStateChanged(GstState /*old_state*/,
                                 GstState /*new_state*/) {}
};

// BusDispatcher owns the bus watch. Attach() adds it to a GMainContext;
// Detach() (or destruction) removes it. Every message kind the handler
// sees is also logged here with a [BusDispatcher] prefix.
class BusDispatcher {
 public:
  explicit BusDispatcher(BusEventHandler& handler);
  ~BusDispatcher();

  BusDispatcher(const BusDispatcher&) = delete;
  BusDispatcher& operator=(const BusDispatcher&) = delete;

  // `pipeline` identifies the top-level element for state-change filtering.
  void Attach(GstBus* bus, GMainContext* context, GstElement* pipeline);
  void Detach();
  bool IsAttached() const { return static_cast<bool>(watch_); }

  // Routes one message to the handler. Called by the watch; public so
  // tests can drive it without a running loop. `message` is borrowed.
  void Dispatch(GstMessage* message);

  uint64_t MessagesDispatched() const { return dispatched_.load(); }

 private:
  static gboolean OnBusMessage(GstBus* bus, GstMessage* message,
                               gpointer user_data);

  BusEventHandler& handler_;
  gst::SourcePtr watch_;
  std::atomic<GstElement*> pipeline_{nullptr};  // not owned
  std::atomic<uint64_t> dispatched_{0};
};

}  // namespace streamtap::bus

#endif  // STREAMTAP_BUS_BUS_DISPATCHER_HPP_
