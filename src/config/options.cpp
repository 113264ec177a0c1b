#include <warden/config/options.hpp>
#include <warden/schema/enum_string.hpp>
#include <warden/schema/entity_kind.hpp>
#include <warden/schema/status_category.hpp>
#include <warden/schema/status_type.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace warden::config {

namespace {

constexpr auto kCommands = std::string_view{
    "keygen, whoami, create-status, update-status, suspend, unsuspend, "
    "unsuspend-if-expired, status, history, forks, list, rebuild-index, "
    "bootstrap, register-admin, remove-admin, is-admin, export, import"};

template <typename T>
void assign(const po::variables_map& vm,
            const char* name,
            std::optional<T>& out) {
  if (vm.contains(name)) {
    out = vm[name].as<T>();
  }
}

}  // namespace

std::optional<settings> parse(const int argc,
                              const char* const argv[],
                              std::string& error) {
  auto result = settings{};
  auto config_path = std::string{};
  auto progenitor = std::string{};

  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style file with any of the replica and logging options");

  auto replica = po::options_description{"Replica"};
  replica.add_options()(
      "db,d", po::value<std::string>(&result.db_path)->default_value("warden.db"),
      "RocksDB directory of the local replica")(
      "key,k",
      po::value<std::string>(&result.key_path)->default_value("warden.key"),
      "File holding the agent's hex-encoded ed25519 private seed")(
      "progenitor", po::value<std::string>(&progenitor),
      "Agent key allowed to register the first administrator")(
      "log-level",
      po::value<std::string>(&result.log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(), "Also write logs to this file");

  auto arguments = po::options_description{"Command arguments"};
  arguments.add_options()("command", po::value<std::string>(&result.command),
                          std::string{kCommands}.c_str())(
      "kind", po::value<std::string>(&result.kind)->default_value("users"),
      warden::schema::join_names(warden::schema::kEntityKindMappings).c_str())(
      "entity,e", po::value<std::string>(), "Entity hash (hex)")(
      "original", po::value<std::string>(),
      "Status chain root; defaults to the entity's chain")(
      "previous", po::value<std::string>(),
      "Record being superseded; defaults to the current tip")(
      "status,s", po::value<std::string>(),
      warden::schema::join_names(warden::schema::kStatusTypeMappings).c_str())(
      "category", po::value<std::string>(),
      warden::schema::join_names(warden::schema::kStatusCategoryMappings)
          .c_str())("reason,r", po::value<std::string>(),
                    "Reason recorded with the status")(
      "days", po::value<uint32_t>(), "Length of a temporary suspension")(
      "until", po::value<uint64_t>(),
      "End of a temporary suspension, milliseconds since the epoch")(
      "agent,a", po::value<std::vector<std::string>>(&result.agents),
      "Agent key (hex); repeatable")(
      "file,f", po::value<std::string>(), "Replica file for export/import");

  auto description = po::options_description{"warden"};
  description.add(general).add(replica).add(arguments);

  auto file_options = po::options_description{};
  file_options.add(replica);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto stream = std::ifstream{path};
      if (!stream) {
        error = "cannot open config file " + path;
        return std::nullopt;
      }
      po::store(po::parse_config_file(stream, file_options), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }

  if (vm.contains("help") || result.command.empty()) {
    auto text = std::ostringstream{};
    text << "usage: warden <command> [options]\n\ncommands: " << kCommands
         << "\n\n"
         << description;
    result.help = true;
    result.help_text = text.str();
    return result;
  }

  assign(vm, "log-file", result.log_file);
  assign(vm, "entity", result.entity);
  assign(vm, "original", result.original);
  assign(vm, "previous", result.previous);
  assign(vm, "status", result.status);
  assign(vm, "category", result.category);
  assign(vm, "reason", result.reason);
  assign(vm, "days", result.days);
  assign(vm, "until", result.until);
  assign(vm, "file", result.file);

  if (!progenitor.empty()) {
    result.progenitor = warden::schema::try_make_agent_key(progenitor);
    if (!result.progenitor.has_value()) {
      error = "progenitor must be 64 hex characters";
      return std::nullopt;
    }
  }
  return result;
}

}  // namespace warden::config
