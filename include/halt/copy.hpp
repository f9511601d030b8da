#ifndef HALT_COPY_HPP
#define HALT_COPY_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <span>
#include <stdexcept>
#include <vector>

#include "concepts.hpp"
#include "transfer_arena.hpp"

namespace halt {

struct copy_options {
  std::size_t buffer_size = 8 * 1024;
};

// Pumps bytes from reader to writer until the reader reports end-of-stream
// or the writer accepts nothing. Returns the number of bytes written.
//
// Wrapping either side in a halter makes the loop pausable: while paused the
// calling thread sleeps inside read() or write(); once stopped the halter
// reports no progress and the loop returns.
template <ByteReader Reader, ByteWriter Writer>
std::uint64_t copy(Reader &reader, Writer &writer, copy_options options = {}) {
  if (options.buffer_size == 0) {
    throw std::invalid_argument("copy: buffer_size must be non-zero");
  }

  transfer_arena arena;
  std::pmr::vector<std::byte> buffer(options.buffer_size, &arena);
  std::uint64_t total = 0;

  for (;;) {
    std::size_t n = reader.read(std::span<std::byte>(buffer));
    if (n == 0) {
      return total;
    }

    std::span<const std::byte> pending(buffer.data(), n);
    while (!pending.empty()) {
      std::size_t written = writer.write(pending);
      if (written == 0) {
        return total;
      }
      // a writer claiming more than it was given only consumed the chunk
      written = std::min(written, pending.size());
      total += written;
      pending = pending.subspan(written);
    }
  }
}

} // namespace halt

#endif // HALT_COPY_HPP
