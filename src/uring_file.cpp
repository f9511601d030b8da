#include "halt/uring_file.hpp"

#include <liburing.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <new>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace halt {

// Linux caps a single read/write at this many bytes anyway.
static constexpr std::size_t MAX_TRANSFER = 0x7ffff000;

[[noreturn]] static void throw_errno(int err, const char* what) {
  throw std::system_error(err, std::system_category(), what);
}

uring_file::uring_file(int fd, fd_ownership ownership)
    : fd_(fd), ownership_(ownership) {
  if (fd < 0)
    throw std::invalid_argument("uring_file: invalid file descriptor");

  // nothrow: the descriptor is already ours, so nothing may throw past here
  ring_ = new (std::nothrow) ::io_uring();
  if (!ring_) {
    std::fprintf(stderr, "[io_uring] ring allocation failed\n");
    return;
  }
  int ret = io_uring_queue_init(queue_depth, ring_, 0);
  if (ret < 0) {
    std::fprintf(stderr, "[io_uring] queue_init failed: %d\n", -ret);
    delete ring_;
    ring_ = nullptr;
  }
}

uring_file::~uring_file() { release(); }

uring_file::uring_file(uring_file&& other) noexcept
    : ring_(std::exchange(other.ring_, nullptr)),
      fd_(std::exchange(other.fd_, -1)),
      ownership_(other.ownership_) {}

uring_file& uring_file::operator=(uring_file&& other) noexcept {
  if (this != &other) {
    release();
    ring_ = std::exchange(other.ring_, nullptr);
    fd_ = std::exchange(other.fd_, -1);
    ownership_ = other.ownership_;
  }
  return *this;
}

void uring_file::release() noexcept {
  if (ring_) {
    io_uring_queue_exit(ring_);
    delete ring_;
    ring_ = nullptr;
  }
  if (ownership_ == fd_ownership::owned && fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

std::size_t uring_file::read(std::span<std::byte> buf) {
  if (buf.empty())
    return 0;
  return transfer(op::read, buf.data(), buf.size());
}

std::size_t uring_file::write(std::span<const std::byte> buf) {
  if (buf.empty())
    return 0;
  // the write path only reads from the buffer
  return transfer(op::write, const_cast<std::byte*>(buf.data()), buf.size());
}

std::size_t uring_file::transfer(op kind, void* data, std::size_t len) {
  const char* what = kind == op::read ? "read" : "write";
  len = std::min(len, MAX_TRANSFER);

  for (;;) {
    int res;
    if (ring_) {
      io_uring_sqe* sqe = io_uring_get_sqe(ring_);
      if (!sqe)
        throw_errno(EBUSY, "io_uring_get_sqe");

      // offset -1: use and advance the file position, works on pipes too
      if (kind == op::read)
        io_uring_prep_read(sqe, fd_, data, static_cast<unsigned>(len),
                           static_cast<__u64>(-1));
      else
        io_uring_prep_write(sqe, fd_, data, static_cast<unsigned>(len),
                            static_cast<__u64>(-1));

      int ret = io_uring_submit(ring_);
      if (ret < 0)
        throw_errno(-ret, "io_uring_submit");

      io_uring_cqe* cqe = nullptr;
      do {
        ret = io_uring_wait_cqe(ring_, &cqe);
      } while (ret == -EINTR);
      if (ret < 0)
        throw_errno(-ret, "io_uring_wait_cqe");

      res = cqe->res;  // bytes transferred or negative errno
      io_uring_cqe_seen(ring_, cqe);
    } else {
      ssize_t n = kind == op::read ? ::read(fd_, data, len)
                                   : ::write(fd_, data, len);
      res = n < 0 ? -errno : static_cast<int>(n);
    }

    if (res == -EINTR)
      continue;
    if (res == -EAGAIN) {
      // non-blocking descriptor with nothing to do yet
      wait_ready(kind);
      continue;
    }
    if (res < 0)
      throw_errno(-res, what);
    return static_cast<std::size_t>(res);
  }
}

void uring_file::wait_ready(op kind) {
  const short events = kind == op::read ? POLLIN : POLLOUT;

  for (;;) {
    int res;
    if (ring_) {
      io_uring_sqe* sqe = io_uring_get_sqe(ring_);
      if (!sqe)
        throw_errno(EBUSY, "io_uring_get_sqe");
      io_uring_prep_poll_add(sqe, fd_, static_cast<unsigned>(events));

      int ret = io_uring_submit(ring_);
      if (ret < 0)
        throw_errno(-ret, "io_uring_submit");

      io_uring_cqe* cqe = nullptr;
      do {
        ret = io_uring_wait_cqe(ring_, &cqe);
      } while (ret == -EINTR);
      if (ret < 0)
        throw_errno(-ret, "io_uring_wait_cqe");

      res = cqe->res;  // ready mask or negative errno
      io_uring_cqe_seen(ring_, cqe);
    } else {
      ::pollfd pfd{fd_, events, 0};
      int n = ::poll(&pfd, 1, -1);
      res = n < 0 ? -errno : pfd.revents;
    }

    if (res == -EINTR)
      continue;
    if (res < 0)
      throw_errno(-res, "poll");
    // POLLHUP and POLLERR count as ready: the retried transfer reports them
    return;
  }
}

} // namespace halt
