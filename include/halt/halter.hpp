#ifndef HALT_HALTER_HPP
#define HALT_HALTER_HPP

#include <cstddef>
#include <iterator>
#include <span>
#include <type_traits>
#include <utility>

#include "concepts.hpp"
#include "gate.hpp"
#include "halt_state.hpp"
#include "remote.hpp"
#include "status.hpp"

namespace halt {

// =============================================================================
// No-progress sentinel
// =============================================================================
//
// Returned by a stopped halter in place of calling the inner object. The
// default is a value-initialized result: 0 bytes for read() and write(),
// std::nullopt for next(). Specialize for result types where that is wrong.

template <typename R> struct no_progress {
  static R value() { return R{}; }
};

// =============================================================================
// Halter - Pausable, stoppable wrapper around a reader, writer or item source
// =============================================================================
//
// Exposes the subset of read()/write()/flush()/next()/next_back()/extend()
// that Inner provides, so a halter<Inner> can stand in for Inner in templated
// code. Each read(), write(), next() and next_back() call is gated once on
// entry:
//
//   stopped -> return no_progress<R>::value() without touching inner
//   paused  -> sleep until resumed or stopped, then re-evaluate
//   running -> call inner exactly once and return its result unchanged
//
// Exceptions from inner propagate unchanged. A pause requested while inner is
// mid-call takes effect at the next call. flush() and extend() do not advance
// the sequence and are forwarded without gating.

template <typename Inner, typename State = halt_state> class halter {
  static_assert(HaltState<State>, "State must model HaltState");

public:
  using inner_type = Inner;
  using state_type = State;
  using remote_type = basic_remote<State>;

  explicit halter(Inner inner) : inner_(std::move(inner)) {}

  // Attach to an existing remote so several halters stop and pause together.
  halter(Inner inner, const remote_type &controller)
      : inner_(std::move(inner)), gate_(controller) {}

  halter(halter &&) = default;
  halter &operator=(halter &&) = default;

  remote_type remote() const { return gate_.remote(); }

  halt_status status() const { return gate_.status(); }

  // ---------------------------------------------------------------------------
  // Gated operations
  // ---------------------------------------------------------------------------

  auto read(std::span<std::byte> buf)
    requires ByteReader<Inner>
  {
    using result_type = std::remove_cvref_t<decltype(inner_.read(buf))>;
    if (!admit()) {
      return no_progress<result_type>::value();
    }
    return inner_.read(buf);
  }

  auto write(std::span<const std::byte> buf)
    requires ByteWriter<Inner>
  {
    using result_type = std::remove_cvref_t<decltype(inner_.write(buf))>;
    if (!admit()) {
      return no_progress<result_type>::value();
    }
    return inner_.write(buf);
  }

  auto next()
    requires ItemSource<Inner>
  {
    using result_type = std::remove_cvref_t<decltype(inner_.next())>;
    if (!admit()) {
      return no_progress<result_type>::value();
    }
    return inner_.next();
  }

  auto next_back()
    requires DoubleEndedSource<Inner>
  {
    using result_type = std::remove_cvref_t<decltype(inner_.next_back())>;
    if (!admit()) {
      return no_progress<result_type>::value();
    }
    return inner_.next_back();
  }

  // ---------------------------------------------------------------------------
  // Ungated pass-through
  // ---------------------------------------------------------------------------

  decltype(auto) flush()
    requires FlushableWriter<Inner>
  {
    return inner_.flush();
  }

  template <typename R>
    requires Extendable<Inner, R>
  decltype(auto) extend(R &&items) {
    return inner_.extend(std::forward<R>(items));
  }

  // ---------------------------------------------------------------------------
  // Range-for over an item source
  // ---------------------------------------------------------------------------

  class item_iterator {
  public:
    using item_type = std::remove_cvref_t<decltype(std::declval<Inner &>().next())>;
    using value_type = typename item_type::value_type;
    using difference_type = std::ptrdiff_t;
    using iterator_concept = std::input_iterator_tag;

    item_iterator() = default;

    explicit item_iterator(halter *owner)
        : owner_(owner), current_(owner->next()) {}

    const value_type &operator*() const { return *current_; }
    const value_type *operator->() const { return &*current_; }

    item_iterator &operator++() {
      current_ = owner_->next();
      return *this;
    }

    void operator++(int) { ++*this; }

    friend bool operator==(const item_iterator &it, std::default_sentinel_t) {
      return !it.current_.has_value();
    }

  private:
    halter *owner_ = nullptr;
    item_type current_;
  };

  // Pulls the first item immediately, so begin() itself is gated.
  auto begin()
    requires ItemSource<Inner>
  {
    return item_iterator{this};
  }

  std::default_sentinel_t end() const
    requires ItemSource<Inner>
  {
    return std::default_sentinel;
  }

  // ---------------------------------------------------------------------------
  // Access to the wrapped object
  // ---------------------------------------------------------------------------

  Inner &get() noexcept { return inner_; }
  const Inner &get() const noexcept { return inner_; }

  Inner into_inner() && { return std::move(inner_); }

private:
  bool admit() { return gate_.admit(); }

  Inner inner_;
  basic_gate<State> gate_;
};

template <typename Inner> halter(Inner) -> halter<Inner>;

template <typename Inner, typename State>
halter(Inner, const basic_remote<State> &) -> halter<Inner, State>;

} // namespace halt

#endif // HALT_HALTER_HPP
