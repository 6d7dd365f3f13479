#ifndef __FT_RAW_FD_UTILS__
#define __FT_RAW_FD_UTILS__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Read/write loops over raw POSIX descriptors (PTY masters).
 */
class RawFdUtils {
 public:
  /** @brief Result of a non-blocking drain. */
  enum ReadStatus { READ_OK, READ_WOULD_BLOCK, READ_CLOSED };

  /**
   * @brief Writes as much of the buffer as a non-blocking `fd` accepts right
   * now.
   * @return Bytes written; less than `count` once the descriptor would block.
   * @throws std::runtime_error when the descriptor is invalid or closed.
   */
  static size_t writeAvailable(int fd, const char* buf, size_t count);

  /**
   * @brief Appends everything currently readable on a non-blocking `fd` to
   * `out`, reading at most `maxBytes`.
   *
   * EIO is reported as READ_CLOSED: Linux returns it on a PTY master once
   * the slave side has gone away.
   */
  static ReadStatus readAvailable(int fd, string* out, size_t maxBytes);

  /** @brief Sets O_NONBLOCK on the descriptor. */
  static void setNonBlocking(int fd);
};
}  // namespace ft
#endif  // __FT_RAW_FD_UTILS__
