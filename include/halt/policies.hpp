#ifndef HALT_POLICIES_HPP
#define HALT_POLICIES_HPP

#include <atomic>
#include <mutex>
#include <thread>

namespace halt {

// =============================================================================
// Lock Policies
// =============================================================================

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        // Spin with relaxed ordering for cache efficiency
        std::this_thread::yield();
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

// Spins only for the short critical section around the status word.
// Waiting for resume still sleeps on the condition variable.
struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

// =============================================================================
// Memory Ordering Policies
// =============================================================================

struct seq_cst_memory_order {
  static constexpr std::memory_order load_order = std::memory_order_seq_cst;
  static constexpr std::memory_order rmw_order = std::memory_order_seq_cst;
};

struct acquire_release_memory_order {
  static constexpr std::memory_order load_order = std::memory_order_acquire;
  static constexpr std::memory_order rmw_order = std::memory_order_acq_rel;
};

} // namespace halt

#endif // HALT_POLICIES_HPP
