// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "hexview/fd.h"
#include "absl/strings/str_format.h"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>

namespace hexview {

absl::StatusOr<FileDescriptor> FileDescriptor::Open(const std::string &filename,
                                                    int flags) {
  int fd = ::open(filename.c_str(), flags);
  if (fd == -1) {
    int e = errno;
    std::string msg =
        absl::StrFormat("Failed to open %s: %s", filename, strerror(e));
    switch (e) {
    case ENOENT:
      return absl::NotFoundError(msg);
    case EACCES:
    case EPERM:
      return absl::PermissionDeniedError(msg);
    default:
      return absl::InternalError(msg);
    }
  }
  return FileDescriptor(fd);
}

absl::Status FileDescriptor::Close() {
  if (!Valid()) {
    return absl::OkStatus();
  }
  int fd = data_->fd;
  // Whatever close returns, the fd is gone.  Don't let the destructor
  // close it again.
  data_->fd = -1;
  data_.reset();
  if (::close(fd) == -1) {
    return absl::InternalError(
        absl::StrFormat("Failed to close fd %d: %s", fd, strerror(errno)));
  }
  return absl::OkStatus();
}

absl::StatusOr<off_t> FileDescriptor::Size() const {
  struct stat st;
  if (::fstat(Fd(), &st) == -1) {
    return absl::InternalError(
        absl::StrFormat("Failed to stat fd %d: %s", Fd(), strerror(errno)));
  }
  return st.st_size;
}

absl::StatusOr<ssize_t> FileDescriptor::Read(void *buffer, size_t length) {
  for (;;) {
    ssize_t n = ::read(Fd(), buffer, length);
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      return absl::InternalError(
          absl::StrFormat("Read failed: %s", strerror(errno)));
    }
    return n;
  }
}

absl::StatusOr<ssize_t> FileDescriptor::Write(const void *buffer,
                                              size_t length) {
  const char *buf = reinterpret_cast<const char *>(buffer);

  size_t total = 0;
  while (total < length) {
    ssize_t n = ::write(Fd(), buf + total, length - total);
    if (n == 0) {
      break;
    }
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      return absl::InternalError(
          absl::StrFormat("Write failed: %s", strerror(errno)));
    }
    total += n;
  }
  return total;
}

} // namespace hexview
