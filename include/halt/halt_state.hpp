#ifndef HALT_HALT_STATE_HPP
#define HALT_HALT_STATE_HPP

#include <atomic>

#include "concepts.hpp"
#include "sync_base.hpp"
#include "policies.hpp"
#include "status.hpp"

namespace halt {

// =============================================================================
// Halt State - Three-valued state machine with blocking wait while paused
// =============================================================================
//
// Shared between one halter (the worker side) and any number of remotes (the
// controller side). Transitions:
//
//   running --set_paused()--> paused --set_resumed()--> running
//   any     --set_stopped()--> stopped   (terminal)
//
// set_paused() and set_resumed() return false when the state is already
// stopped and leave it untouched. Requesting the state that already holds is
// a successful no-op.
//
// The status word is only read and written under the lock, and the lock is
// held from the status check in wait_while_paused() until the waiter is
// parked on the condition variable. Every transition that can release a
// waiter notifies while still holding the lock, so a resume or stop can never
// slip between the check and the wait.

template <typename LockPolicy = mutex_lock_policy>
class basic_halt_state
    : public sync_primitive_base<LockPolicy> {
  using base_type = sync_primitive_base<LockPolicy>;

  halt_status status_{halt_status::running};

public:
  using lock_policy = LockPolicy;

  basic_halt_state() = default;

  bool set_paused() {
    typename base_type::lock_type lock(this->mutex_);
    if (status_ == halt_status::stopped) {
      return false;
    }
    status_ = halt_status::paused;
    return true;
  }

  bool set_resumed() {
    typename base_type::lock_type lock(this->mutex_);
    if (status_ == halt_status::stopped) {
      return false;
    }
    status_ = halt_status::running;
    this->notify_all();
    return true;
    // lock released by RAII after notify
  }

  // Always succeeds; stopping twice is the same as stopping once.
  bool set_stopped() {
    typename base_type::lock_type lock(this->mutex_);
    status_ = halt_status::stopped;
    this->notify_all();
    return true;
  }

  bool stop_if_paused() {
    typename base_type::lock_type lock(this->mutex_);
    if (status_ != halt_status::paused) {
      return false;
    }
    status_ = halt_status::stopped;
    this->notify_all();
    return true;
  }

  halt_status current() const {
    typename base_type::lock_type lock(this->mutex_);
    return status_;
  }

  // Parks the calling thread while paused. Returns running or stopped.
  halt_status wait_while_paused() {
    typename base_type::lock_type lock(this->mutex_);
    this->wait_for_condition(lock,
                             [this] { return status_ != halt_status::paused; });
    return status_;
  }
};

// =============================================================================
// Atomic Halt State - Same contract on top of std::atomic wait/notify
// =============================================================================
//
// atomic::wait(paused) compares and sleeps as one step inside the kernel
// futex, so a transition that lands between the load and the wait makes the
// wait return immediately instead of being lost.

template <typename MemoryOrder = seq_cst_memory_order>
  requires MemoryOrderPolicy<MemoryOrder>
class atomic_halt_state {
  std::atomic<halt_status> status_{halt_status::running};

public:
  using memory_order_policy = MemoryOrder;

  atomic_halt_state() = default;

  atomic_halt_state(const atomic_halt_state &) = delete;
  atomic_halt_state &operator=(const atomic_halt_state &) = delete;

  bool set_paused() {
    halt_status expected = halt_status::running;
    if (status_.compare_exchange_strong(expected, halt_status::paused,
                                        MemoryOrder::rmw_order,
                                        MemoryOrder::load_order)) {
      return true;
    }
    return expected == halt_status::paused;
  }

  bool set_resumed() {
    halt_status expected = halt_status::paused;
    if (status_.compare_exchange_strong(expected, halt_status::running,
                                        MemoryOrder::rmw_order,
                                        MemoryOrder::load_order)) {
      status_.notify_all();
      return true;
    }
    return expected == halt_status::running;
  }

  bool set_stopped() {
    status_.exchange(halt_status::stopped, MemoryOrder::rmw_order);
    status_.notify_all();
    return true;
  }

  bool stop_if_paused() {
    halt_status expected = halt_status::paused;
    if (status_.compare_exchange_strong(expected, halt_status::stopped,
                                        MemoryOrder::rmw_order,
                                        MemoryOrder::load_order)) {
      status_.notify_all();
      return true;
    }
    return false;
  }

  halt_status current() const { return status_.load(MemoryOrder::load_order); }

  halt_status wait_while_paused() {
    halt_status status = status_.load(MemoryOrder::load_order);
    while (status == halt_status::paused) {
      status_.wait(halt_status::paused, MemoryOrder::load_order);
      status = status_.load(MemoryOrder::load_order);
    }
    return status;
  }
};

// =============================================================================
// Type Aliases
// =============================================================================

using halt_state = basic_halt_state<mutex_lock_policy>;
using spin_halt_state = basic_halt_state<spinlock_policy>;

static_assert(HaltState<halt_state>);
static_assert(HaltState<spin_halt_state>);
static_assert(HaltState<atomic_halt_state<>>);

} // namespace halt

#endif // HALT_HALT_STATE_HPP
