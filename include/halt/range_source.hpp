#ifndef HALT_RANGE_SOURCE_HPP
#define HALT_RANGE_SOURCE_HPP

#include <iterator>
#include <optional>
#include <ranges>
#include <utility>

namespace halt {

// Presents an iterator/sentinel pair as an item source (next() returning
// std::optional), which is the shape halter gates on. Items are copied out.
template <std::input_iterator It, std::sentinel_for<It> Sent = It>
class range_source {
public:
  using value_type = std::iter_value_t<It>;

  range_source(It first, Sent last)
      : first_(std::move(first)), last_(std::move(last)) {}

  std::optional<value_type> next() {
    if (first_ == last_) {
      return std::nullopt;
    }
    value_type item = *first_;
    ++first_;
    return item;
  }

  std::optional<value_type> next_back()
    requires std::bidirectional_iterator<It> && std::same_as<It, Sent>
  {
    if (first_ == last_) {
      return std::nullopt;
    }
    --last_;
    return *last_;
  }

private:
  It first_;
  Sent last_;
};

// The range must outlive the source; rvalue containers are rejected.
template <std::ranges::borrowed_range R>
auto from_range(R &&range) {
  return range_source<std::ranges::iterator_t<R>, std::ranges::sentinel_t<R>>(
      std::ranges::begin(range), std::ranges::end(range));
}

} // namespace halt

#endif // HALT_RANGE_SOURCE_HPP
