// Repository: StreamTap
// Component: Log Capture
// Purpose: Test adapter that records Logger output for contract tests.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_TESTS_FIXTURES_LOG_CAPTURE_H_
#define STREAMTAP_TESTS_FIXTURES_LOG_CAPTURE_H_

#include <mutex>
#include <string>
#include <vector>

#include "streamtap/util/Logger.hpp"

namespace streamtap::tests::fixtures
{

  enum class LogLevel
  {
    INFO,
    WARN,
    ERROR
  };

  struct LogLine
  {
    LogLevel level;
    std::string text;

    LogLine(LogLevel l, const std::string &t) : level(l), text(t) {}
  };

  // LogCapture installs Logger sinks for its lifetime and records every
  // Info/Warn/Error line. Only one instance may be alive at a time.
  class LogCapture
  {
  public:
    LogCapture()
    {
      using streamtap::util::Logger;
      Logger::SetInfoSink([this](const std::string &line)
                          { Record(LogLevel::INFO, line); });
      Logger::SetWarnSink([this](const std::string &line)
                          { Record(LogLevel::WARN, line); });
      Logger::SetErrorSink([this](const std::string &line)
                           { Record(LogLevel::ERROR, line); });
    }

    ~LogCapture()
    {
      using streamtap::util::Logger;
      Logger::SetInfoSink(nullptr);
      Logger::SetWarnSink(nullptr);
      Logger::SetErrorSink(nullptr);
    }

    LogCapture(const LogCapture &) = delete;
    LogCapture &operator=(const LogCapture &) = delete;

    void Clear()
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.clear();
    }

    std::vector<LogLine> GetLines() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return lines_;
    }

    size_t GetCount(LogLevel level) const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      size_t count = 0;
      for (const auto &line : lines_)
      {
        if (line.level == level)
        {
          count++;
        }
      }
      return count;
    }

    // True if any line of `level` contains `needle`.
    bool Contains(LogLevel level, const std::string &needle) const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto &line : lines_)
      {
        if (line.level == level && line.text.find(needle) != std::string::npos)
        {
          return true;
        }
      }
      return false;
    }

  private:
    void Record(LogLevel level, const std::string &text)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.emplace_back(level, text);
    }

    mutable std::mutex mutex_;
    std::vector<LogLine> lines_;
  };

} // namespace streamtap::tests::fixtures

#endif // STREAMTAP_TESTS_FIXTURES_LOG_CAPTURE_H_
