// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "hexview/byte_stream.h"

#include <algorithm>
#include <cstring>

namespace hexview {

absl::StatusOr<size_t> FileByteStream::Read(char *buffer, size_t length) {
  absl::StatusOr<ssize_t> n = fd_.Read(buffer, length);
  if (!n.ok()) {
    return n.status();
  }
  return static_cast<size_t>(*n);
}

absl::StatusOr<size_t> MemoryByteStream::Read(char *buffer, size_t length) {
  size_t n = std::min(length, length_ - pos_);
  if (n == 0) {
    return 0;
  }
  memcpy(buffer, addr_ + pos_, n);
  pos_ += n;
  return n;
}

} // namespace hexview
