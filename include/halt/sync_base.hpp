#ifndef HALT_SYNC_BASE_HPP
#define HALT_SYNC_BASE_HPP

#include <condition_variable>
#include <mutex>

#include "policies.hpp"

namespace halt {

// =============================================================================
// Sync Primitive Base - Provides mutex + condition_variable pattern
// =============================================================================

template <typename LockPolicy = mutex_lock_policy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;
  std::condition_variable_any cv_;

  template <typename Predicate>
  void wait_for_condition(lock_type &lock, Predicate pred) {
    cv_.wait(lock, pred);
  }

  void notify_all() { cv_.notify_all(); }

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

} // namespace halt

#endif // HALT_SYNC_BASE_HPP
