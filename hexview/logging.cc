// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "logging.h"
#include "absl/strings/str_format.h"
#include "clock.h"

#include <algorithm>
#include <cstdlib>
#include <errno.h>
#include <inttypes.h>
#include <string.h>
#include <time.h>

namespace hexview {

static const char *LogLevelAsString(LogLevel level) {
  switch (level) {
  case LogLevel::kVerboseDebug:
    return "V";
  case LogLevel::kDebug:
    return "D";
  case LogLevel::kInfo:
    return "I";
  case LogLevel::kWarning:
    return "W";
  case LogLevel::kError:
    return "E";
  case LogLevel::kFatal:
    return "F";
  }
  return "U";
}

Logger::~Logger() {
  if (tee_stream_ != nullptr) {
    fclose(tee_stream_);
  }
}

color::Color Logger::ColorForLogLevel(LogLevel level) const {
  switch (level) {
  case LogLevel::kVerboseDebug:
    return theme_ == LogTheme::kLight ? color::BoldCyan() : color::BoldGreen();
  case LogLevel::kDebug:
    return color::BoldGreen();
  case LogLevel::kInfo:
    return theme_ == LogTheme::kLight ? color::BoldBlue()
                                      : color::BoldNormal();
  case LogLevel::kWarning:
    return theme_ == LogTheme::kLight ? color::BoldYellow()
                                      : color::BoldMagenta();
  case LogLevel::kError:
  case LogLevel::kFatal:
    return color::BoldRed();
  }
  return color::BoldCyan();
}

void Logger::SetTheme(LogTheme theme) {
  switch (theme) {
  case LogTheme::kDefault:
#if defined(__APPLE__)
    theme_ = LogTheme::kLight;
#else
    theme_ = LogTheme::kDark;
#endif
    break;
  default:
    theme_ = theme;
    break;
  }
}

absl::Status Logger::SetLogLevel(const std::string &s) {
  if (s == "verbose") {
    min_level_ = LogLevel::kVerboseDebug;
  } else if (s == "debug") {
    min_level_ = LogLevel::kDebug;
  } else if (s == "info") {
    min_level_ = LogLevel::kInfo;
  } else if (s == "warning") {
    min_level_ = LogLevel::kWarning;
  } else if (s == "error") {
    min_level_ = LogLevel::kError;
  } else if (s == "fatal") {
    min_level_ = LogLevel::kFatal;
  } else {
    return absl::InvalidArgumentError(
        absl::StrFormat("Unknown log level %s", s));
  }
  return absl::OkStatus();
}

absl::Status Logger::SetTeeFile(const std::string &filename, bool truncate) {
  if (tee_stream_ != nullptr) {
    fclose(tee_stream_);
  }
  tee_stream_ = fopen(filename.c_str(), truncate ? "w" : "a");
  if (tee_stream_ == nullptr) {
    return absl::InternalError(absl::StrFormat("Failed to open tee file %s: %s",
                                               filename, strerror(errno)));
  }
  return absl::OkStatus();
}

void Logger::Log(LogLevel level, const char *fmt, ...) {
  if (!enabled_ || level < min_level_) {
    return;
  }
  va_list ap;
  va_start(ap, fmt);
  VLog(level, fmt, ap);
  va_end(ap);
}

void Logger::VLog(LogLevel level, const char *fmt, va_list ap) {
  if (!enabled_ || level < min_level_) {
    return;
  }
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
  int n = vsnprintf(buffer_, sizeof(buffer_), fmt, ap);
#pragma GCC diagnostic pop
  if (n < 0) {
    return;
  }
  size_t len = std::min(static_cast<size_t>(n), sizeof(buffer_) - 1);

  // Strip final \n if present.  Refactoring from printf can leave
  // this in place.
  if (len > 0 && buffer_[len - 1] == '\n') {
    buffer_[len - 1] = '\0';
  }
  Emit(level, WallTime(), buffer_);
}

void Logger::Emit(LogLevel level, uint64_t timestamp, const char *text) {
  char timebuf[64];
  struct tm tm;
  time_t secs = timestamp / 1000000000LL;
  size_t n = strftime(timebuf, sizeof(timebuf), "%Y-%m-%d %H:%M:%S",
                      localtime_r(&secs, &tm));
  snprintf(timebuf + n, sizeof(timebuf) - n, ".%09" PRIu64,
           timestamp % 1000000000);

  switch (display_mode_) {
  case LogDisplayMode::kPlain:
    fprintf(output_stream_, "%s %s: %s: %s\n", timebuf, subsystem_.c_str(),
            LogLevelAsString(level), text);
    break;
  case LogDisplayMode::kColor:
    fprintf(output_stream_, "%s%s %s: %s: %s%s\n",
            color::SetColor(ColorForLogLevel(level)).c_str(), timebuf,
            subsystem_.c_str(), LogLevelAsString(level), text,
            color::ResetColor().c_str());
    break;
  }

  if (tee_stream_ != nullptr) {
    fprintf(tee_stream_, "%s %s: %s: %s\n", timebuf, subsystem_.c_str(),
            LogLevelAsString(level), text);
    fflush(tee_stream_);
  }
  if (level == LogLevel::kFatal) {
    abort();
  }
}

} // namespace hexview
