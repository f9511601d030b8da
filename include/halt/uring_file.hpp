#ifndef HALT_URING_FILE_HPP
#define HALT_URING_FILE_HPP

#include <cstddef>
#include <span>

struct io_uring;         // forward-declare liburing's ring type

namespace halt {

enum class fd_ownership { borrowed, owned };

// Blocking byte stream over a file descriptor. Each read()/write() is one
// io_uring submission on a private ring, reaped on the calling thread, so the
// object fits halter and halt::copy like any other reader or writer.
//
// If the kernel refuses to set up a ring the stream logs once and issues
// plain read(2)/write(2) instead. OS errors are thrown as std::system_error.
// EINTR is retried. On a non-blocking descriptor an EAGAIN result parks the
// caller in a poll for readiness and the transfer is resubmitted, so read()
// and write() block the same way on either kind of descriptor.
class uring_file {
public:
  static constexpr unsigned queue_depth = 8;

  explicit uring_file(int fd, fd_ownership ownership = fd_ownership::borrowed);
  ~uring_file();

  uring_file(const uring_file&) = delete;
  uring_file& operator=(const uring_file&) = delete;

  uring_file(uring_file&& other) noexcept;
  uring_file& operator=(uring_file&& other) noexcept;

  // Returns bytes read, 0 at end of file.
  std::size_t read(std::span<std::byte> buf);

  // Returns bytes written, possibly fewer than buf.size().
  std::size_t write(std::span<const std::byte> buf);

  // Writes go straight to the kernel; nothing is buffered here.
  void flush() noexcept {}

  int fd() const noexcept { return fd_; }
  bool uses_ring() const noexcept { return ring_ != nullptr; }

private:
  enum class op { read, write };

  std::size_t transfer(op kind, void* data, std::size_t len);
  void wait_ready(op kind);
  void release() noexcept;

  struct io_uring* ring_ = nullptr;   // heap-allocated to avoid pulling header
  int fd_ = -1;
  fd_ownership ownership_ = fd_ownership::borrowed;
};

} // namespace halt

#endif // HALT_URING_FILE_HPP
