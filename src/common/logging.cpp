#include <warden/common/logging.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace warden::common {

bool configure_logging(const std::string_view level,
                       const std::optional<std::string>& log_file) {
  auto parsed = spdlog::level::from_str(std::string{level});
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }

  spdlog::init_thread_pool(8192, 1);

  // Command output goes to stdout; logs stay on stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (log_file.has_value()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(parsed);
  return true;
}

}  // namespace warden::common
