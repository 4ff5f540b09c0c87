// Repository: StreamTap
// Component: GStreamer Init
// Purpose: Process-wide, idempotent gst_init.
// Copyright (c) 2025 RetroVue

#include "streamtap/gst/GstInit.hpp"

#include <gst/gst.h>

#include <mutex>
#include <sstream>
#include <string>

#include "streamtap/gst/GstPtr.hpp"
#include "streamtap/runtime/Errors.hpp"
#include "streamtap/util/Logger.hpp"

namespace streamtap::gst {

using streamtap::util::Logger;

void EnsureInitialized() {
  static std::once_flag once;
  static std::string init_error;

  std::call_once(once, []() {
    if (gst_is_initialized()) return;
    GError* raw_err = nullptr;
    if (!gst_init_check(nullptr, nullptr, &raw_err)) {
      ErrorPtr err(raw_err);
      init_error = ErrorMessage(err.get());
      return;
    }
    guint major = 0, minor = 0, micro = 0, nano = 0;
    gst_version(&major, &minor, &micro, &nano);
    std::ostringstream oss;
    oss << "[GstInit] GStreamer " << major << "." << minor << "." << micro
        << " initialized";
    Logger::Debug(oss.str());
  });

  if (!init_error.empty()) {
    throw ConfigurationError("gst_init failed: " + init_error);
  }
}

}  // namespace streamtap::gst
