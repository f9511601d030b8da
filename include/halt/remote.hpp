#ifndef HALT_REMOTE_HPP
#define HALT_REMOTE_HPP

#include <memory>
#include <utility>

#include "concepts.hpp"
#include "halt_state.hpp"
#include "status.hpp"

namespace halt {

template <typename State> class basic_gate;

// Lightweight copyable handle to a halt state. Every copy controls the same
// halter(s) and gate(s); copies may be used concurrently from any thread. A remote keeps
// the state alive but never owns the wrapped stream.
template <typename State = halt_state>
  requires HaltState<State>
class basic_remote {
public:
  using state_type = State;

  // A fresh running state not yet attached to any halter.
  basic_remote() : state_(std::make_shared<State>()) {}

  // Pauses: the worker sleeps at its next halter call until resumed or
  // stopped. Returns false if already stopped.
  bool pause() const { return state_->set_paused(); }

  // Returns false if already stopped.
  bool resume() const { return state_->set_resumed(); }

  bool stop() const { return state_->set_stopped(); }

  // Stops only a paused halter, releasing a worker that would otherwise never
  // be resumed. Returns true if this call stopped it.
  bool stop_if_paused() const { return state_->stop_if_paused(); }

  halt_status status() const { return state_->current(); }

  bool is_running() const { return status() == halt_status::running; }
  bool is_paused() const { return status() == halt_status::paused; }
  bool is_stopped() const { return status() == halt_status::stopped; }

  // Whether both handles drive the same state.
  bool controls_same(const basic_remote &other) const {
    return state_ == other.state_;
  }

private:
  template <typename> friend class basic_gate;

  explicit basic_remote(std::shared_ptr<State> state)
      : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

using remote = basic_remote<halt_state>;

} // namespace halt

#endif // HALT_REMOTE_HPP
