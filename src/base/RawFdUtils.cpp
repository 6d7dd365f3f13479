#include "RawFdUtils.hpp"

#define BUF_SIZE (16 * 1024)

namespace ft {
size_t RawFdUtils::writeAvailable(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAvailable");
  }

  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The child is not draining its input; the rest waits for select.
        break;
      }
      STERROR << "Cannot write to fd: " << strerror(localErrno);
      throw std::runtime_error("Cannot write to fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: fd closed");
    }
    bytesWritten += rc;
  }
  return bytesWritten;
}

RawFdUtils::ReadStatus RawFdUtils::readAvailable(int fd, string* out,
                                                 size_t maxBytes) {
  char b[BUF_SIZE];
  size_t total = 0;
  while (total < maxBytes) {
    size_t want = std::min(sizeof(b), maxBytes - total);
    ssize_t rc = ::read(fd, b, want);
    if (rc > 0) {
      out->append(b, rc);
      total += rc;
      continue;
    }
    if (rc == 0) {
      return READ_CLOSED;
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return total > 0 ? READ_OK : READ_WOULD_BLOCK;
    }
    if (localErrno != EIO) {
      LOG(INFO) << "PTY read error on fd " << fd << ": "
                << strerror(localErrno);
    }
    return READ_CLOSED;
  }
  return READ_OK;
}

void RawFdUtils::setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}
}  // namespace ft
