// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "hexview/cli.h"
#include "hexview/logging.h"
#include "hexview/text_sink.h"

#include <cstdio>
#include <string>

int main(int argc, char **argv) {
  hexview::Logger logger("hexview");

  absl::StatusOr<hexview::Options> options = hexview::ParseOptions(argc, argv);
  if (!options.ok()) {
    logger.Log(hexview::LogLevel::kError, "%s (try %s --help)",
               std::string(options.status().message()).c_str(), argv[0]);
    return 1;
  }
  if (options->help) {
    fputs(hexview::Usage(argv[0]).c_str(), stdout);
    return 0;
  }
  if (absl::Status status = hexview::ConfigureLogger(*options, logger);
      !status.ok()) {
    logger.Log(hexview::LogLevel::kError, "%s",
               std::string(status.message()).c_str());
    return 1;
  }

  hexview::StdioSink sink(stdout);
  if (absl::Status status = hexview::DumpFile(options->filename, sink, logger);
      !status.ok()) {
    logger.Log(hexview::LogLevel::kError, "%s",
               std::string(status.message()).c_str());
    return 1;
  }
  return 0;
}
