#include <NGIN/Attributes/Log.hpp>

#include <fmt/core.h>

#include <atomic>
#include <cstdio>

namespace NGIN::Attributes
{
  namespace
  {
    void DefaultSink(LogLevel level, std::string_view message)
    {
      fmt::print(stderr, "[NGIN.Attributes] {}: {}\n", ToString(level), message);
    }

    std::atomic<LogLevel> g_level{LogLevel::Off};
    std::atomic<LogSink> g_sink{&DefaultSink};
  } // namespace

  void SetLogLevel(LogLevel level) noexcept { g_level.store(level, std::memory_order_relaxed); }

  LogLevel GetLogLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

  void SetLogSink(LogSink sink) noexcept
  {
    g_sink.store(sink ? sink : &DefaultSink, std::memory_order_release);
  }

  std::string_view ToString(LogLevel level) noexcept
  {
    switch (level)
    {
    case LogLevel::Trace:
      return "trace";
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
    case LogLevel::Off:
      return "off";
    }
    return "unknown";
  }

  namespace detail
  {
    bool LogEnabled(LogLevel level) noexcept
    {
      const auto current = g_level.load(std::memory_order_relaxed);
      return current != LogLevel::Off && level != LogLevel::Off && level >= current;
    }

    void EmitLog(LogLevel level, std::string_view message)
    {
      g_sink.load(std::memory_order_acquire)(level, message);
    }
  } // namespace detail

} // namespace NGIN::Attributes
