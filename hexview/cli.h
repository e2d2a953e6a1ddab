// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __HEXVIEW_CLI_H
#define __HEXVIEW_CLI_H

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "hexview/logging.h"
#include "hexview/text_sink.h"

#include <string>

namespace hexview {

struct Options {
  std::string filename;
  std::string log_level = "info";
  std::string log_file; // Empty for no tee.
  bool help = false;
};

// Parses the command line:
//
//   hexview [-l level] [-t log_file] [-h] <file>
//
// Missing or extra file names and unknown options are InvalidArgument
// errors.  If -h is given the file name is not required.
absl::StatusOr<Options> ParseOptions(int argc, char **argv);

std::string Usage(const char *program);

// Applies the log options to the logger.
absl::Status ConfigureLogger(const Options &options, Logger &logger);

// Opens filename, dumps all of it into sink and closes it again.  Errors
// from opening, reading, writing and closing are returned in that order
// of precedence; the file is closed even if the dump fails.
absl::Status DumpFile(const std::string &filename, TextSink &sink,
                      Logger &logger);

} // namespace hexview

#endif //  __HEXVIEW_CLI_H
