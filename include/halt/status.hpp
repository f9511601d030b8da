#ifndef HALT_STATUS_HPP
#define HALT_STATUS_HPP

#include <string_view>

namespace halt {

// running <-> paused, anything -> stopped. stopped is terminal.
enum class halt_status { running, paused, stopped };

std::string_view to_string(halt_status status) noexcept;

} // namespace halt

#endif // HALT_STATUS_HPP
