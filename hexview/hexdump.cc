// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "hexdump.h"
#include "absl/strings/str_format.h"

#include <algorithm>
#include <cstring>

namespace hexview {

namespace {
constexpr char kHexDigits[] = "0123456789ABCDEF";

inline bool IsPrintable(unsigned char c) { return c >= 0x20 && c <= 0x7e; }
} // namespace

std::string FormatOffset(uint64_t offset) {
  return absl::StrFormat("%08x", offset);
}

std::string FormatHex(const char *bytes, size_t length) {
  std::string s;
  s.reserve(length * 3);
  for (size_t i = 0; i < length; i++) {
    unsigned char b = static_cast<unsigned char>(bytes[i]);
    if (i > 0) {
      s += ' ';
    }
    s += kHexDigits[b >> 4];
    s += kHexDigits[b & 0xf];
  }
  return s;
}

std::string FormatAscii(const char *bytes, size_t length) {
  std::string s(length, '.');
  for (size_t i = 0; i < length; i++) {
    if (IsPrintable(static_cast<unsigned char>(bytes[i]))) {
      s[i] = bytes[i];
    }
  }
  return s;
}

std::string FormatRow(uint64_t offset, const char *bytes, size_t length) {
  return absl::StrFormat("%s  %-*s  |%s|\n", FormatOffset(offset),
                         static_cast<int>(kHexColumnWidth),
                         FormatHex(bytes, length), FormatAscii(bytes, length));
}

absl::Status HexDumper::EmitRow(Cursor &cursor, TextSink &sink) {
  std::string line = FormatRow(cursor.offset, cursor.row, cursor.fill);
  if (absl::Status status = sink.Write(line); !status.ok()) {
    return status;
  }
  cursor.offset += cursor.fill;
  cursor.fill = 0;
  return absl::OkStatus();
}

absl::Status HexDumper::Dump(ByteStream &source, TextSink &sink) {
  // One buffer for the whole dump, reused for every read.
  std::vector<char> chunk(chunk_size_);
  Cursor cursor;

  for (;;) {
    absl::StatusOr<size_t> n = source.Read(chunk.data(), chunk.size());
    if (!n.ok()) {
      return n.status();
    }
    if (*n == 0) {
      break;
    }
    // Fill the current row from the chunk, emitting each time it fills.
    // The row may have been started by a previous read.
    size_t pos = 0;
    while (pos < *n) {
      size_t take = std::min(kRowWidth - cursor.fill, *n - pos);
      memcpy(cursor.row + cursor.fill, chunk.data() + pos, take);
      cursor.fill += take;
      pos += take;
      if (cursor.fill == kRowWidth) {
        if (absl::Status status = EmitRow(cursor, sink); !status.ok()) {
          return status;
        }
      }
    }
  }

  if (cursor.fill > 0) {
    if (absl::Status status = EmitRow(cursor, sink); !status.ok()) {
      return status;
    }
  }
  return sink.Flush();
}

absl::Status Hexdump(const void *addr, size_t length, FILE *out) {
  MemoryByteStream source(addr, length);
  StdioSink sink(out);
  HexDumper dumper;
  return dumper.Dump(source, sink);
}

} // namespace hexview
