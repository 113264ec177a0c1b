#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace warden::common {

/// Install the process-wide async logger: colour console sink plus an
/// optional file sink. Returns false for an unknown level name.
bool configure_logging(std::string_view level,
                       const std::optional<std::string>& log_file);

}  // namespace warden::common
