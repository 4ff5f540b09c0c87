// Repository: StreamTap
// Component: BufferSink Contract Tests
// Purpose: Sample decode, skip-with-warning paths and queue hand-off,
//          driven without a running pipeline.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>

#include "fixtures/LogCapture.h"
#include "streamtap/endpoints/BufferSink.hpp"
#include "streamtap/gst/GstInit.hpp"
#include "streamtap/gst/GstPtr.hpp"
#include "streamtap/runtime/Errors.hpp"

namespace streamtap::endpoints::testing {
namespace {

using std::chrono::milliseconds;
using streamtap::tests::fixtures::LogCapture;
using streamtap::tests::fixtures::LogLevel;

constexpr const char* kRgbCaps =
    "video/x-raw,format=RGB,width=4,height=2,framerate=10/1";

class BufferSinkContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    gst::EnsureInitialized();
    appsink_.reset(gst_element_factory_make("appsink", "tap"));
    ASSERT_TRUE(appsink_) << "appsink factory unavailable";
    gst_object_ref_sink(appsink_.get());
  }

  // Sample of `size` bytes stamped with `pts`; `caps` may be null.
  static gst::SamplePtr MakeSample(const char* caps, size_t size,
                                   uint64_t pts) {
    gst::BufferPtr buffer(gst_buffer_new_allocate(nullptr, size, nullptr));
    gst_buffer_memset(buffer.get(), 0, 0x5a, size);
    GST_BUFFER_PTS(buffer.get()) = pts;
    GST_BUFFER_DURATION(buffer.get()) = 100 * GST_MSECOND;
    GST_BUFFER_OFFSET(buffer.get()) = pts / (100 * GST_MSECOND);

    gst::CapsPtr parsed(caps ? gst_caps_from_string(caps) : nullptr);
    return gst::SamplePtr(
        gst_sample_new(buffer.get(), parsed.get(), nullptr, nullptr));
  }

  static bool Inactive() { return false; }

  gst::ElementPtr appsink_;
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(BufferSinkContractTest, RejectsNonAppsinkElement) {
  gst::ElementPtr fakesink(gst_element_factory_make("fakesink", nullptr));
  ASSERT_TRUE(fakesink);
  gst_object_ref_sink(fakesink.get());
  EXPECT_THROW(BufferSink(fakesink.get(), 4, buffer::QueuePolicy::kBlock),
               ConfigurationError);
}

TEST_F(BufferSinkContractTest, StartsUnresolved) {
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  EXPECT_EQ(sink.name(), "tap");
  EXPECT_FALSE(sink.Format().has_value());
  EXPECT_FALSE(sink.ResolveFromNegotiatedCaps());
  EXPECT_TRUE(sink.QueueEmpty());
}

// =============================================================================
// Sample handling
// =============================================================================

TEST_F(BufferSinkContractTest, QueuesDecodedSampleWithTiming) {
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  auto sample = MakeSample(kRgbCaps, 4 * 2 * 3, 300 * GST_MSECOND);

  EXPECT_EQ(sink.HandleSample(sample.get()), GST_FLOW_OK);
  ASSERT_TRUE(sink.Format().has_value());
  EXPECT_EQ(sink.Format()->video().format, "RGB");
  EXPECT_EQ(sink.QueueSize(), 1u);
  EXPECT_EQ(sink.SamplesQueued(), 1u);

  auto out = sink.Pop(milliseconds(10), &BufferSinkContractTest::Inactive);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->data.shape(), (format::Shape{2, 4, 3}));
  EXPECT_EQ(out->data.bytes()[0], 0x5a);
  EXPECT_EQ(out->pts, 300 * GST_MSECOND);
  EXPECT_EQ(out->duration, 100 * GST_MSECOND);
  EXPECT_EQ(out->offset, 3u);
  EXPECT_FALSE(out->HasDts());
}

TEST_F(BufferSinkContractTest, SampleWithoutCapsIsSkippedWithWarning) {
  LogCapture logs;
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  auto sample = MakeSample(nullptr, 24, 0);

  EXPECT_EQ(sink.HandleSample(sample.get()), GST_FLOW_OK);
  EXPECT_EQ(sink.SamplesSkipped(), 1u);
  EXPECT_TRUE(sink.QueueEmpty());
  EXPECT_TRUE(logs.Contains(LogLevel::WARN, "without caps"));
}

TEST_F(BufferSinkContractTest, UnsupportedFormatWarnsOnce) {
  LogCapture logs;
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  const char* i420 = "video/x-raw,format=I420,width=4,height=2,framerate=10/1";

  for (int i = 0; i < 3; ++i) {
    auto sample = MakeSample(i420, 12, i * 100 * GST_MSECOND);
    EXPECT_EQ(sink.HandleSample(sample.get()), GST_FLOW_OK);
  }
  EXPECT_EQ(sink.SamplesSkipped(), 3u);
  EXPECT_TRUE(sink.QueueEmpty());
  EXPECT_FALSE(sink.Format().has_value());
  EXPECT_EQ(logs.GetCount(LogLevel::WARN), 1u);
  EXPECT_TRUE(logs.Contains(LogLevel::WARN, "Cannot resolve format"));
}

TEST_F(BufferSinkContractTest, ShortBufferIsSkipped) {
  LogCapture logs;
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  auto sample = MakeSample(kRgbCaps, 5, 0);
  EXPECT_EQ(sink.HandleSample(sample.get()), GST_FLOW_OK);
  EXPECT_EQ(sink.SamplesSkipped(), 1u);
  EXPECT_TRUE(logs.Contains(LogLevel::ERROR, "Decode failed"));
}

TEST_F(BufferSinkContractTest, LeakyQueueDropsOldest) {
  BufferSink sink(appsink_.get(), 2, buffer::QueuePolicy::kLeaky);
  for (uint64_t i = 1; i <= 3; ++i) {
    auto sample = MakeSample(kRgbCaps, 24, i * 100 * GST_MSECOND);
    ASSERT_EQ(sink.HandleSample(sample.get()), GST_FLOW_OK);
  }
  EXPECT_EQ(sink.Dropped(), 1u);
  EXPECT_EQ(sink.QueueSize(), 2u);

  auto first = sink.Pop(milliseconds(10), &BufferSinkContractTest::Inactive);
  auto second = sink.Pop(milliseconds(10), &BufferSinkContractTest::Inactive);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->pts, 200 * GST_MSECOND);
  EXPECT_EQ(second->pts, 300 * GST_MSECOND);
}

TEST_F(BufferSinkContractTest, ClosedSinkAsksUpstreamToFlush) {
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  sink.Close();
  auto sample = MakeSample(kRgbCaps, 24, 0);
  EXPECT_EQ(sink.HandleSample(sample.get()), GST_FLOW_FLUSHING);
}

// =============================================================================
// Pop
// =============================================================================

TEST_F(BufferSinkContractTest, PopOnFinishedEmptySinkReturnsImmediately) {
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(sink.Pop(milliseconds(500), &BufferSinkContractTest::Inactive)
                   .has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(100));
}

TEST_F(BufferSinkContractTest, PopDrainsQueueAfterPipelineFinished) {
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  auto sample = MakeSample(kRgbCaps, 24, 0);
  ASSERT_EQ(sink.HandleSample(sample.get()), GST_FLOW_OK);

  EXPECT_TRUE(sink.Pop(milliseconds(10), &BufferSinkContractTest::Inactive)
                  .has_value());
  EXPECT_FALSE(sink.Pop(milliseconds(10), &BufferSinkContractTest::Inactive)
                   .has_value());
}

TEST_F(BufferSinkContractTest, PopKeepsWaitingWhileActive) {
  BufferSink sink(appsink_.get(), 4, buffer::QueuePolicy::kBlock);
  int checks = 0;
  auto active_for_three_slices = [&checks] { return ++checks <= 3; };
  EXPECT_FALSE(sink.Pop(milliseconds(5), active_for_three_slices).has_value());
  EXPECT_EQ(checks, 4);
}

}  // namespace
}  // namespace streamtap::endpoints::testing
