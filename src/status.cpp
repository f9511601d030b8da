#include "halt/status.hpp"

namespace halt {

std::string_view to_string(halt_status status) noexcept {
  switch (status) {
  case halt_status::running:
    return "running";
  case halt_status::paused:
    return "paused";
  case halt_status::stopped:
    return "stopped";
  }
  return "unknown";
}

} // namespace halt
