// Repository: StreamTap
// Component: GStreamer Handles
// Purpose: Unique-ownership wrappers around GStreamer/GLib reference-counted objects.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_GST_GST_PTR_HPP_
#define STREAMTAP_GST_GST_PTR_HPP_

#include <gst/gst.h>
#include <glib.h>

#include <memory>
#include <string>

namespace streamtap::gst {

// Each handle owns exactly one reference. Construct from a pointer the
// caller already owns (transfer full); use Ref() to take an extra reference
// on a borrowed pointer (transfer none).

struct ObjectUnref {
  void operator()(gpointer obj) const { gst_object_unref(obj); }
};
struct CapsUnref {
  void operator()(GstCaps* caps) const { gst_caps_unref(caps); }
};
struct SampleUnref {
  void operator()(GstSample* sample) const { gst_sample_unref(sample); }
};
struct BufferUnref {
  void operator()(GstBuffer* buffer) const { gst_buffer_unref(buffer); }
};
struct MessageUnref {
  void operator()(GstMessage* msg) const { gst_message_unref(msg); }
};
struct ErrorFree {
  void operator()(GError* err) const { g_error_free(err); }
};
struct GFree {
  void operator()(gpointer mem) const { g_free(mem); }
};
struct MainContextUnref {
  void operator()(GMainContext* ctx) const { g_main_context_unref(ctx); }
};
struct MainLoopUnref {
  void operator()(GMainLoop* loop) const { g_main_loop_unref(loop); }
};
struct SourceUnref {
  void operator()(GSource* src) const {
    g_source_destroy(src);
    g_source_unref(src);
  }
};

using ElementPtr = std::unique_ptr<GstElement, ObjectUnref>;
using BusPtr = std::unique_ptr<GstBus, ObjectUnref>;
using PadPtr = std::unique_ptr<GstPad, ObjectUnref>;
using CapsPtr = std::unique_ptr<GstCaps, CapsUnref>;
using SamplePtr = std::unique_ptr<GstSample, SampleUnref>;
using BufferPtr = std::unique_ptr<GstBuffer, BufferUnref>;
using MessagePtr = std::unique_ptr<GstMessage, MessageUnref>;
using ErrorPtr = std::unique_ptr<GError, ErrorFree>;
using CharPtr = std::unique_ptr<gchar, GFree>;
using MainContextPtr = std::unique_ptr<GMainContext, MainContextUnref>;
using MainLoopPtr = std::unique_ptr<GMainLoop, MainLoopUnref>;
// Destroys (detaches) the source before dropping the reference.
using SourcePtr = std::unique_ptr<GSource, SourceUnref>;

// Maps a GstBuffer for the lifetime of the object. Check ok() before
// touching data(); an unmappable buffer leaves data() null and size() 0.
class ScopedBufferMap {
 public:
  ScopedBufferMap(GstBuffer* buffer, GstMapFlags flags) : buffer_(buffer) {
    ok_ = buffer_ && gst_buffer_map(buffer_, &info_, flags);
  }
  ~ScopedBufferMap() {
    if (ok_) gst_buffer_unmap(buffer_, &info_);
  }

  ScopedBufferMap(const ScopedBufferMap&) = delete;
  ScopedBufferMap& operator=(const ScopedBufferMap&) = delete;

  bool ok() const { return ok_; }
  const guint8* data() const { return ok_ ? info_.data : nullptr; }
  gsize size() const { return ok_ ? info_.size : 0; }

 private:
  GstBuffer* buffer_;
  GstMapInfo info_ = GST_MAP_INFO_INIT;
  bool ok_ = false;
};

inline ElementPtr RefElement(GstElement* element) {
  return ElementPtr(element ? GST_ELEMENT(gst_object_ref(element)) : nullptr);
}

// Null-safe caps → string for logging.
inline std::string CapsToString(const GstCaps* caps) {
  if (!caps) return "<null>";
  CharPtr str(gst_caps_to_string(caps));
  return str ? std::string(str.get()) : std::string("<null>");
}

inline std::string ErrorMessage(const GError* err) {
  return (err && err->message) ? std::string(err->message) : std::string("unknown error");
}

}  // namespace streamtap::gst

#endif  // STREAMTAP_GST_GST_PTR_HPP_
