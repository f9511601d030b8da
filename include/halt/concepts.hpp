#ifndef HALT_CONCEPTS_HPP
#define HALT_CONCEPTS_HPP

#include <atomic>
#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

#include "status.hpp"

namespace halt {

// =============================================================================
// Capability Concepts
// =============================================================================

// Sequential byte source: read() fills a prefix of the buffer and returns the
// number of bytes produced, 0 meaning end-of-stream.
template <typename R>
concept ByteReader = requires(R r, std::span<std::byte> buf) {
  { r.read(buf) } -> std::convertible_to<std::size_t>;
};

// Sequential byte sink: write() consumes a prefix of the buffer and returns
// the number of bytes accepted.
template <typename W>
concept ByteWriter = requires(W w, std::span<const std::byte> buf) {
  { w.write(buf) } -> std::convertible_to<std::size_t>;
};

template <typename W>
concept FlushableWriter = ByteWriter<W> && requires(W w) {
  { w.flush() };
};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_v = is_optional<std::remove_cvref_t<T>>::value;

// Forward iteration: next() yields the following item, std::nullopt at the end.
template <typename S>
concept ItemSource = requires(S s) {
  { s.next() };
} && is_optional_v<decltype(std::declval<S &>().next())>;

template <typename S>
concept DoubleEndedSource = ItemSource<S> && requires(S s) {
  { s.next_back() } -> std::same_as<decltype(s.next())>;
};

template <typename S, typename R>
concept Extendable = requires(S s, R &&r) {
  { s.extend(std::forward<R>(r)) };
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = requires {
  typename P::mutex_type;
  typename P::lock_type;
};

template <typename P>
concept MemoryOrderPolicy = requires {
  { P::load_order } -> std::convertible_to<std::memory_order>;
  { P::rmw_order } -> std::convertible_to<std::memory_order>;
};

// =============================================================================
// Halt State Concept
// =============================================================================

template <typename S>
concept HaltState = std::default_initializable<S> && requires(S s, const S cs) {
  { s.set_paused() } -> std::same_as<bool>;
  { s.set_resumed() } -> std::same_as<bool>;
  { s.set_stopped() } -> std::same_as<bool>;
  { s.stop_if_paused() } -> std::same_as<bool>;
  { cs.current() } -> std::same_as<halt_status>;
  { s.wait_while_paused() } -> std::same_as<halt_status>;
};

} // namespace halt

#endif // HALT_CONCEPTS_HPP
