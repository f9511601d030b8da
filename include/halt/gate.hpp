#ifndef HALT_GATE_HPP
#define HALT_GATE_HPP

#include <memory>

#include "concepts.hpp"
#include "halt_state.hpp"
#include "remote.hpp"
#include "status.hpp"

namespace halt {

// =============================================================================
// Gate - Worker-side end of a halt state
// =============================================================================
//
// The counterpart of basic_remote for code that is not a reader, writer or
// item source. A worker loop checks the gate once per unit of work:
//
//   halt::gate g;
//   auto r = g.remote();          // hand to controller threads
//   while (g.admit()) {           // sleeps while paused, false once stopped
//     do_one_step();
//   }
//
// halter keeps one of these to gate its own calls.

template <typename State = halt_state> class basic_gate {
  static_assert(HaltState<State>, "State must model HaltState");

public:
  using state_type = State;
  using remote_type = basic_remote<State>;

  basic_gate() : state_(std::make_shared<State>()) {}

  // Share the state behind an existing remote.
  explicit basic_gate(const remote_type &controller)
      : state_(controller.state_) {}

  remote_type remote() const { return remote_type{state_}; }

  halt_status status() const { return state_->current(); }
  bool is_stopped() const { return status() == halt_status::stopped; }

  // Blocks while paused. Returns running or stopped.
  halt_status wait_while_paused() const { return state_->wait_while_paused(); }

  // running -> true, stopped -> false, paused -> sleeps first
  bool admit() const { return wait_while_paused() != halt_status::stopped; }

private:
  std::shared_ptr<State> state_;
};

template <typename State>
basic_gate(const basic_remote<State> &) -> basic_gate<State>;

using gate = basic_gate<halt_state>;

} // namespace halt

#endif // HALT_GATE_HPP
