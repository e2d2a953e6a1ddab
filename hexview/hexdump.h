// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __HEXVIEW_HEXDUMP_H
#define __HEXVIEW_HEXDUMP_H

#include "absl/status/status.h"
#include "hexview/byte_stream.h"
#include "hexview/text_sink.h"

#include <cstdint>
#include <stddef.h>
#include <stdio.h>
#include <string>
#include <vector>

namespace hexview {

// Bytes shown on each line of a dump.
constexpr size_t kRowWidth = 16;

// Default size of a single read from the source.  One page.
constexpr size_t kChunkSize = 4096;

// Width of the hex column for a full row: 16 groups of 2 digits with a
// space between each.
constexpr size_t kHexColumnWidth = kRowWidth * 3 - 1;

// Offset of a row, zero padded to at least 8 lowercase hex digits.
std::string FormatOffset(uint64_t offset);

// Two uppercase hex digits per byte, separated by single spaces.
std::string FormatHex(const char *bytes, size_t length);

// One character per byte: the byte itself if printable ASCII, else '.'.
std::string FormatAscii(const char *bytes, size_t length);

// A complete output line, including the trailing newline:
//
// 00000000  48 65 6C 6C 6F                                   |Hello|
//
// length must be between 1 and kRowWidth.  A short row has its hex
// column padded with spaces so that the ASCII column lines up with the
// rows above it.
std::string FormatRow(uint64_t offset, const char *bytes, size_t length);

// A HexDumper reads a stream through a fixed size buffer and writes one
// formatted line for every kRowWidth bytes, plus a final shorter line
// if the stream length is not a multiple of kRowWidth.  Rows are built
// independently of how the source splits its data, so a row may be
// made from the tail of one read and the head of the next.
class HexDumper {
public:
  explicit HexDumper(size_t chunk_size = kChunkSize)
      : chunk_size_(chunk_size == 0 ? kChunkSize : chunk_size) {}

  // Dumps the whole of source into sink and then flushes the sink.  The
  // first error from the source or the sink stops the dump and is
  // returned.  Lines already written are left in the sink.
  absl::Status Dump(ByteStream &source, TextSink &sink);

  size_t ChunkSize() const { return chunk_size_; }

private:
  struct Cursor {
    char row[kRowWidth];
    size_t fill = 0;     // Bytes in row.
    uint64_t offset = 0; // Stream offset of row[0].
  };

  static absl::Status EmitRow(Cursor &cursor, TextSink &sink);

  size_t chunk_size_;
};

// Almost the first thing I write in a new project is a hexdump
// function.  Very useful.  Offsets are relative to addr.
absl::Status Hexdump(const void *addr, size_t length, FILE *out = stdout);

} // namespace hexview

#endif //  __HEXVIEW_HEXDUMP_H
