#ifndef HALT_TRANSFER_ARENA_HPP
#define HALT_TRANSFER_ARENA_HPP

#include <mimalloc.h>

#include <cstddef>
#include <memory_resource>

namespace halt {

// =============================================================================
// Transfer Arena - private mimalloc heap for one copy loop's buffers
// =============================================================================
//
// Every block comes from a heap created for this arena alone, and the whole
// heap is torn down in one step when the arena goes away, so a long-running
// copy never fragments the thread's default heap.
//
// mimalloc heaps belong to the thread that created them: allocate from and
// destroy the arena on that thread. Blocks may be freed from anywhere.

class transfer_arena : public std::pmr::memory_resource {
public:
  transfer_arena();
  ~transfer_arena() override;

  transfer_arena(const transfer_arena&) = delete;
  transfer_arena& operator=(const transfer_arena&) = delete;

  // True if p points into a block handed out by this arena.
  bool owns(const void* p) const noexcept;

private:
  void* do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource& other) const noexcept override;

  mi_heap_t* heap_;
};

} // namespace halt

#endif // HALT_TRANSFER_ARENA_HPP
