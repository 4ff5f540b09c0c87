// Repository: StreamTap
// Component: BusDispatcher
// Purpose: Bus watch installation and message routing.
// Copyright (c) 2025 RetroVue

#include "streamtap/bus/BusDispatcher.hpp"

#include <exception>
#include <sstream>
#include <string>

#include "streamtap/util/Logger.hpp"

namespace streamtap::bus {

using streamtap::util::Logger;

namespace {

BusError ParseErrorMessage(GstMessage* message, bool warning) {
  GError* raw_err = nullptr;
  gchar* raw_debug = nullptr;
  if (warning) {
    gst_message_parse_warning(message, &raw_err, &raw_debug);
  } else {
    gst_message_parse_error(message, &raw_err, &raw_debug);
  }
  gst::ErrorPtr err(raw_err);
  gst::CharPtr debug(raw_debug);

  BusError out;
  out.source = GST_MESSAGE_SRC_NAME(message);
  if (err) {
    out.domain = g_quark_to_string(err->domain);
    out.code = err->code;
  }
  out.message = gst::ErrorMessage(err.get());
  if (debug) out.debug = debug.get();
  return out;
}

std::string FormatBusError(const char* label, const BusError& e) {
  std::ostringstream oss;
  oss << "[BusDispatcher] " << label << " from '" << e.source << "' ("
      << e.domain << " " << e.code << "): " << e.message;
  if (!e.debug.empty()) oss << " | " << e.debug;
  return oss.str();
}

}  // namespace

BusDispatcher::BusDispatcher(BusEventHandler& handler) : handler_(handler) {}

BusDispatcher::~BusDispatcher() { Detach(); }

void BusDispatcher::Attach(GstBus* bus, GMainContext* context,
                           GstElement* pipeline) {
  Detach();
  pipeline_ = pipeline;
  watch_.reset(gst_bus_create_watch(bus));
  g_source_set_callback(watch_.get(),
                        reinterpret_cast<GSourceFunc>(&BusDispatcher::OnBusMessage),
                        this, nullptr);
  g_source_attach(watch_.get(), context);
}

void BusDispatcher::Detach() {
  watch_.reset();
  pipeline_ = nullptr;
}

gboolean BusDispatcher::OnBusMessage(GstBus* /*bus*/, GstMessage* message,
                                     gpointer user_data) {
  try {
    static_cast<BusDispatcher*>(user_data)->Dispatch(message);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[BusDispatcher] Handler failed: ") + e.what());
  }
  return G_SOURCE_CONTINUE;
}

void BusDispatcher::Dispatch(GstMessage* message) {
  ++dispatched_;

  switch (GST_MESSAGE_TYPE(message)) {
    case GST_MESSAGE_ERROR: {
      const BusError error = ParseErrorMessage(message, false);
      Logger::Error(FormatBusError("Error", error));
      handler_.OnBusError(error);
      break;
    }
    case GST_MESSAGE_WARNING: {
      const BusError warning = ParseErrorMessage(message, true);
      Logger::Warn(FormatBusError("Warning", warning));
      handler_.OnBusWarning(warning);
      break;
    }
    case GST_MESSAGE_EOS:
      Logger::Info("[BusDispatcher] End of stream");
      handler_.OnBusEndOfStream();
      break;
    case GST_MESSAGE_ELEMENT: {
      const GstStructure* structure = gst_message_get_structure(message);
      const std::string source = GST_MESSAGE_SRC_NAME(message);
      if (Logger::DebugEnabled()) {
        Logger::Debug("[BusDispatcher] Element message '" +
                      std::string(structure ? gst_structure_get_name(structure)
                                            : "<none>") +
                      "' from '" + source + "'");
      }
      handler_.OnBusElement(source, structure);
      break;
    }
    case GST_MESSAGE_STATE_CHANGED: {
      GstElement* pipeline = pipeline_.load();
      if (!pipeline || GST_MESSAGE_SRC(message) != GST_OBJECT(pipeline)) break;
      GstState old_state = GST_STATE_VOID_PENDING;
      GstState new_state = GST_STATE_VOID_PENDING;
      gst_message_parse_state_changed(message, &old_state, &new_state, nullptr);
      Logger::Debug(std::string("[BusDispatcher] Pipeline state ") +
                    gst_element_state_get_name(old_state) + " -> " +
                    gst_element_state_get_name(new_state));
      handler_.OnBusStateChanged(old_state, new_state);
      break;
    }
    default:
      break;
  }
}

}  // namespace streamtap::bus
