// Log.hpp
// Library diagnostics: leveled messages formatted with fmt and routed to a replaceable sink.
#pragma once

#include <NGIN/Attributes/Export.hpp>

#include <fmt/core.h>

#include <string_view>
#include <utility>

namespace NGIN::Attributes
{

  enum class LogLevel : unsigned char
  {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5,
  };

  using LogSink = void (*)(LogLevel, std::string_view);

  // Logging is off until a level is set.
  NGIN_ATTRIBUTES_API void SetLogLevel(LogLevel level) noexcept;
  [[nodiscard]] NGIN_ATTRIBUTES_API LogLevel GetLogLevel() noexcept;

  // nullptr restores the default sink (stderr).
  NGIN_ATTRIBUTES_API void SetLogSink(LogSink sink) noexcept;

  [[nodiscard]] NGIN_ATTRIBUTES_API std::string_view ToString(LogLevel level) noexcept;

  namespace detail
  {
    [[nodiscard]] NGIN_ATTRIBUTES_API bool LogEnabled(LogLevel level) noexcept;
    NGIN_ATTRIBUTES_API void EmitLog(LogLevel level, std::string_view message);

    template <class... Args>
    inline void Log(LogLevel level, fmt::format_string<Args...> format, Args &&...args)
    {
      if (!LogEnabled(level))
        return;
      EmitLog(level, fmt::format(format, std::forward<Args>(args)...));
    }
  } // namespace detail

} // namespace NGIN::Attributes
