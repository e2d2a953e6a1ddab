// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __HEXVIEW_TEXT_SINK_H
#define __HEXVIEW_TEXT_SINK_H

#include "absl/status/status.h"

#include <cstdio>
#include <string>
#include <string_view>

namespace hexview {

// Append-only destination for text.  Writes must appear in the order
// they were made.  Flush pushes anything buffered to its final
// destination.
class TextSink {
public:
  virtual ~TextSink() = default;

  virtual absl::Status Write(std::string_view text) = 0;
  virtual absl::Status Flush() { return absl::OkStatus(); }
};

// Writes to a stdio stream.  The stream is not closed.
class StdioSink : public TextSink {
public:
  explicit StdioSink(FILE *stream) : stream_(stream) {}

  absl::Status Write(std::string_view text) override;
  absl::Status Flush() override;

private:
  FILE *stream_;
};

// Collects everything written in memory.
class StringSink : public TextSink {
public:
  absl::Status Write(std::string_view text) override {
    text_.append(text.data(), text.size());
    return absl::OkStatus();
  }

  const std::string &Text() const { return text_; }

private:
  std::string text_;
};

} // namespace hexview

#endif //  __HEXVIEW_TEXT_SINK_H
