// Repository: StreamTap
// Component: GStreamer Init
// Purpose: Process-wide, idempotent gst_init.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_GST_GST_INIT_HPP_
#define STREAMTAP_GST_GST_INIT_HPP_

namespace streamtap::gst {

// Initializes GStreamer once per process. Safe to call from any thread and
// any number of times; later calls are no-ops. Throws ConfigurationError if
// the library cannot be initialized.
void EnsureInitialized();

}  // namespace streamtap::gst

#endif  // STREAMTAP_GST_GST_INIT_HPP_
