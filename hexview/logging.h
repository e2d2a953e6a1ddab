// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __HEXVIEW_LOGGING_H
#define __HEXVIEW_LOGGING_H

#include "absl/status/status.h"
#include "hexview/color.h"

#include <cstdint>
#include <cstdio>
#include <stdarg.h>
#include <string>
#include <unistd.h>

namespace hexview {

enum class LogLevel {
  kVerboseDebug,
  kDebug,
  kInfo,
  kWarning,
  kError,
  kFatal,
};

enum class LogDisplayMode {
  kPlain,
  kColor,
};

enum class LogTheme {
  kDefault,
  kLight,
  kDark,
};

// A logger logs timestamped messages to a FILE pointer, possibly in color.
// Only messages at or above the current log level are logged.
class Logger {
public:
  Logger() { SetTheme(LogTheme::kDefault); }
  Logger(const std::string &subsystem, bool enabled = true,
         LogTheme theme = LogTheme::kDefault)
      : subsystem_(subsystem), enabled_(enabled) {
    SetTheme(theme);
  }
  virtual ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Enable() { enabled_ = true; }
  void Disable() { enabled_ = false; }

  // We can also tee the output to a file.  Calling this more than
  // once will close the current file and open a new one.
  absl::Status SetTeeFile(const std::string &filename, bool truncate = true);

  // Log a message at the given log level.
  virtual void Log(LogLevel level, const char *fmt, ...)
      __attribute__((format(printf, 3, 4)));
  virtual void VLog(LogLevel level, const char *fmt, va_list ap);

  void SetTheme(LogTheme theme);

  // All logged messages with a level below the min level will be
  // ignored.
  void SetLogLevel(LogLevel l) { min_level_ = l; }

  // Level by name: verbose, debug, info, warning, error or fatal.
  absl::Status SetLogLevel(const std::string &s);

  LogLevel GetLogLevel() const { return min_level_; }

  // Color is used when the stream is a TTY.
  void SetOutputStream(FILE *stream) {
    output_stream_ = stream;
    display_mode_ = isatty(fileno(stream)) ? LogDisplayMode::kColor
                                           : LogDisplayMode::kPlain;
  }
  void SetDisplayMode(LogDisplayMode mode) { display_mode_ = mode; }

private:
  static constexpr size_t kBufferSize = 4096;

  void Emit(LogLevel level, uint64_t timestamp, const char *text);
  color::Color ColorForLogLevel(LogLevel level) const;

  std::string subsystem_;
  bool enabled_ = true;
  char buffer_[kBufferSize];
  LogLevel min_level_ = LogLevel::kInfo;
  FILE *output_stream_ = stderr;
  LogDisplayMode display_mode_ =
      isatty(STDERR_FILENO) ? LogDisplayMode::kColor : LogDisplayMode::kPlain;
  LogTheme theme_ = LogTheme::kDefault;
  FILE *tee_stream_ = nullptr;
};

} // namespace hexview

#endif //  __HEXVIEW_LOGGING_H
