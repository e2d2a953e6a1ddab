// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "hexview/cli.h"
#include "absl/strings/str_format.h"
#include "hexview/byte_stream.h"
#include "hexview/clock.h"
#include "hexview/fd.h"
#include "hexview/hexdump.h"

#include <getopt.h>
#include <inttypes.h>

namespace hexview {

absl::StatusOr<Options> ParseOptions(int argc, char **argv) {
  static const struct option long_options[] = {
      {"log_level", required_argument, nullptr, 'l'},
      {"log_file", required_argument, nullptr, 't'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  Options options;

  // Zero makes glibc reinitialize getopt so we can parse more than once.
  optind = 0;
  opterr = 0;
  for (;;) {
    int opt = getopt_long(argc, argv, ":l:t:h", long_options, nullptr);
    if (opt == -1) {
      break;
    }
    switch (opt) {
    case 'l':
      options.log_level = optarg;
      break;
    case 't':
      options.log_file = optarg;
      break;
    case 'h':
      options.help = true;
      break;
    case ':':
      return absl::InvalidArgumentError(
          absl::StrFormat("Option %s requires an argument", argv[optind - 1]));
    default:
      return absl::InvalidArgumentError(
          absl::StrFormat("Unknown option %s", argv[optind - 1]));
    }
  }

  if (options.help) {
    return options;
  }
  int remaining = argc - optind;
  if (remaining < 1) {
    return absl::InvalidArgumentError("No file name given");
  }
  if (remaining > 1) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Only one file can be dumped, got %d", remaining));
  }
  options.filename = argv[optind];
  return options;
}

std::string Usage(const char *program) {
  return absl::StrFormat("usage: %s [options] <file>\n"
                         "  -l, --log_level=LEVEL  verbose, debug, info, "
                         "warning or error (default info)\n"
                         "  -t, --log_file=FILE    also write log messages "
                         "to FILE\n"
                         "  -h, --help             show this message\n",
                         program);
}

absl::Status ConfigureLogger(const Options &options, Logger &logger) {
  if (absl::Status status = logger.SetLogLevel(options.log_level);
      !status.ok()) {
    return status;
  }
  if (!options.log_file.empty()) {
    if (absl::Status status = logger.SetTeeFile(options.log_file, false);
        !status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

absl::Status DumpFile(const std::string &filename, TextSink &sink,
                      Logger &logger) {
  absl::StatusOr<FileDescriptor> fd = FileDescriptor::Open(filename);
  if (!fd.ok()) {
    return fd.status();
  }

  absl::StatusOr<off_t> size = fd->Size();
  if (!size.ok()) {
    // The stat error is the one to report.
    (void)fd->Close();
    return size.status();
  }
  logger.Log(LogLevel::kDebug, "Dumping %s, %" PRId64 " bytes",
             filename.c_str(), static_cast<int64_t>(*size));

  FileByteStream stream(*fd);
  HexDumper dumper;
  uint64_t start = Now();
  absl::Status status = dumper.Dump(stream, sink);
  uint64_t elapsed = Now() - start;

  absl::Status close_status = fd->Close();
  if (!status.ok()) {
    return status;
  }
  if (!close_status.ok()) {
    return close_status;
  }
  logger.Log(LogLevel::kDebug, "Dumped %s in %" PRIu64 " us", filename.c_str(),
             elapsed / 1000);
  return absl::OkStatus();
}

} // namespace hexview
