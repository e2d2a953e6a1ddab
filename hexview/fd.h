// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __HEXVIEW_FD_H
#define __HEXVIEW_FD_H

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/types.h>
#include <unistd.h>

namespace hexview {

// A FileDescriptor holds an OS file descriptor.  Copies share the
// same underlying descriptor, which is closed when the last copy goes
// away unless it has been closed explicitly first.  Close errors are
// only visible through an explicit call to Close().
class FileDescriptor {
public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : data_(std::make_shared<SharedData>(fd)) {}

  FileDescriptor(const FileDescriptor &f) = default;
  FileDescriptor(FileDescriptor &&f) = default;
  FileDescriptor &operator=(const FileDescriptor &f) = default;
  FileDescriptor &operator=(FileDescriptor &&f) = default;

  ~FileDescriptor() = default;

  // Opens the given file.  The error code reflects the reason:
  // NotFound, PermissionDenied or Internal.
  static absl::StatusOr<FileDescriptor> Open(const std::string &filename,
                                             int flags = O_RDONLY);

  int Fd() const { return data_ == nullptr ? -1 : data_->fd; }
  bool Valid() const { return Fd() != -1; }

  // Closes the descriptor for all copies and reports any error from
  // close(2).  Closing an invalid descriptor is a no-op.
  absl::Status Close();

  // Size of the open file in bytes, from fstat(2).
  absl::StatusOr<off_t> Size() const;

  // Reads at most length bytes with a single read(2), retrying on EINTR.
  // Returns 0 at end of file.
  absl::StatusOr<ssize_t> Read(void *buffer, size_t length);

  // Writes all length bytes, looping over partial writes.
  absl::StatusOr<ssize_t> Write(const void *buffer, size_t length);

private:
  struct SharedData {
    explicit SharedData(int f) : fd(f) {}
    ~SharedData() {
      if (fd != -1) {
        (void)::close(fd);
      }
    }
    int fd = -1;
  };

  std::shared_ptr<SharedData> data_;
};

} // namespace hexview

#endif //  __HEXVIEW_FD_H
