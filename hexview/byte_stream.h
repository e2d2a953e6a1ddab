// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __HEXVIEW_BYTE_STREAM_H
#define __HEXVIEW_BYTE_STREAM_H

#include "absl/status/statusor.h"
#include "hexview/fd.h"

#include <cstddef>
#include <utility>

namespace hexview {

// A source of bytes read in bounded pieces.  Read returns between 1 and
// length bytes while there is data, 0 at the end of the stream and an
// error status if the underlying source fails.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual absl::StatusOr<size_t> Read(char *buffer, size_t length) = 0;
};

// Reads from an open file descriptor, starting at its current position.
// The descriptor is shared, not closed by the stream.
class FileByteStream : public ByteStream {
public:
  explicit FileByteStream(FileDescriptor fd) : fd_(std::move(fd)) {}

  absl::StatusOr<size_t> Read(char *buffer, size_t length) override;

private:
  FileDescriptor fd_;
};

// Reads from a region of memory owned by someone else.
class MemoryByteStream : public ByteStream {
public:
  MemoryByteStream(const void *addr, size_t length)
      : addr_(reinterpret_cast<const char *>(addr)), length_(length) {}

  absl::StatusOr<size_t> Read(char *buffer, size_t length) override;

private:
  const char *addr_;
  size_t length_;
  size_t pos_ = 0;
};

} // namespace hexview

#endif //  __HEXVIEW_BYTE_STREAM_H
