// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "hexview/text_sink.h"
#include "absl/strings/str_format.h"

#include <errno.h>
#include <string.h>

namespace hexview {

absl::Status StdioSink::Write(std::string_view text) {
  if (text.empty()) {
    return absl::OkStatus();
  }
  size_t n = fwrite(text.data(), 1, text.size(), stream_);
  if (n != text.size()) {
    return absl::InternalError(
        absl::StrFormat("Write failed: %s", strerror(errno)));
  }
  return absl::OkStatus();
}

absl::Status StdioSink::Flush() {
  if (fflush(stream_) != 0) {
    return absl::InternalError(
        absl::StrFormat("Flush failed: %s", strerror(errno)));
  }
  return absl::OkStatus();
}

} // namespace hexview
