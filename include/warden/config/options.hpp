#pragma once

#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

/// Command line and config-file settings of the `warden` tool.
struct settings final {
  std::string command;
  std::string db_path{"warden.db"};
  std::string key_path{"warden.key"};
  std::string log_level{"info"};
  std::optional<std::string> log_file;
  std::optional<warden::schema::agent_key_t> progenitor;

  // Command arguments.
  std::string kind{"users"};
  std::optional<std::string> entity;
  std::optional<std::string> original;
  std::optional<std::string> previous;
  std::optional<std::string> status;
  std::optional<std::string> category;
  std::optional<std::string> reason;
  std::optional<uint32_t> days;
  std::optional<uint64_t> until;
  std::vector<std::string> agents;
  std::optional<std::string> file;

  bool help{false};
  std::string help_text;
};

/// Parse the command line, then the file named by `--config` if any. Values
/// given on the command line win over the file.
///
/// On failure, `error` contains a human-readable reason.
std::optional<settings> parse(int argc,
                              const char* const argv[],
                              std::string& error);

}  // namespace warden::config
