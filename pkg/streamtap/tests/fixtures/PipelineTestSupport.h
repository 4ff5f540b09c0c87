// Repository: StreamTap
// Component: Pipeline Test Support
// Purpose: Short-timeout configs, polling waits and array builders for
//          pipeline contract tests.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_TESTS_FIXTURES_PIPELINE_TEST_SUPPORT_H_
#define STREAMTAP_TESTS_FIXTURES_PIPELINE_TEST_SUPPORT_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "streamtap/buffer/NDArray.hpp"
#include "streamtap/runtime/PipelineConfig.hpp"

namespace streamtap::tests::fixtures
{

  // Grace periods short enough that a whole pipeline test stays well under
  // a second, long enough for a loaded CI box.
  constexpr std::chrono::milliseconds kTestShutdownTimeout{100};
  constexpr std::chrono::milliseconds kTestPrerollTimeout{2000};

  inline runtime::PipelineConfig FastConfig(const std::string &description)
  {
    runtime::PipelineConfig config(description);
    config.shutdown_timeout = kTestShutdownTimeout;
    config.preroll_timeout = kTestPrerollTimeout;
    return config;
  }

  // Polls `predicate` every 5 ms until it holds or `timeout` elapses.
  inline bool WaitUntil(const std::function<bool()> &predicate,
                        std::chrono::milliseconds timeout)
  {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
      if (predicate())
      {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
  }

  // uint8 array whose byte i is (seed + i) mod 256.
  inline buffer::NDArray MakePatternArray(const format::Shape &shape,
                                          uint8_t seed = 0)
  {
    buffer::NDArray array(shape, format::ElementType::kUInt8);
    uint8_t *bytes = array.mutable_bytes();
    for (size_t i = 0; i < array.nbytes(); ++i)
    {
      bytes[i] = static_cast<uint8_t>(seed + i);
    }
    return array;
  }

} // namespace streamtap::tests::fixtures

#endif // STREAMTAP_TESTS_FIXTURES_PIPELINE_TEST_SUPPORT_H_
