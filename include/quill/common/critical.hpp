#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace quill::common {

/// Log an unrecoverable fault, flush the loggers and bring the process down.
///
/// Reserved for storage and codec failures where the keyed state can no
/// longer be trusted; request validation failures are reported through
/// `schema::operation_result_t` instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace quill::common
