#include "halt/transfer_arena.hpp"

#include <new>

namespace halt {

transfer_arena::transfer_arena() : heap_(mi_heap_new()) {
  if (!heap_)
    throw std::bad_alloc();
}

transfer_arena::~transfer_arena() {
  // releases any block still outstanding
  mi_heap_destroy(heap_);
}

bool transfer_arena::owns(const void* p) const noexcept {
  return p && mi_heap_check_owned(heap_, p);
}

void* transfer_arena::do_allocate(std::size_t bytes, std::size_t alignment) {
  void* p = mi_heap_malloc_aligned(heap_, bytes, alignment);
  if (!p)
    throw std::bad_alloc();
  return p;
}

void transfer_arena::do_deallocate(void* p, std::size_t /*bytes*/,
                                   std::size_t /*alignment*/) {
  mi_free(p);
}

bool transfer_arena::do_is_equal(
    const std::pmr::memory_resource& other) const noexcept {
  return this == &other;
}

} // namespace halt
