#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <string_view>

namespace tally::common {

/// Stop on a failure the journal cannot work around: a store that will not
/// open or commit, a record that will not decode, a lock file that cannot be
/// taken. Domain failures never come here; they travel as error codes.
///
/// The async logger is shut down first so the reason reaches tally.log.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("fatal: {}", message);
  spdlog::shutdown();
  std::terminate();
}

/// Same, naming the file or store involved and the underlying cause.
[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view path,
                                  const std::string_view cause) {
  spdlog::critical("fatal: {} {}: {}", message, path, cause);
  spdlog::shutdown();
  std::terminate();
}

}  // namespace tally::common
