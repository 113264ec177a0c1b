#include <spdlog/spdlog.h>
#include <warden/common/logging.hpp>
#include <warden/config/options.hpp>
#include <warden/crypto/keypair.hpp>
#include <warden/execution/engine.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <system_error>

using namespace warden::schema;

namespace {

struct context final {
  const warden::config::settings& settings;
  warden::execution::engine& engine;
  warden::chain::encoder_t& encoder;
};

using handler_t = std::function<int(context&)>;

template <typename T>
int report(const operation_result<T>& result) {
  if (result) {
    return 0;
  }
  std::cerr << "error: " << to_string(result.code) << " [" << result.codespace
            << "] " << result.log << std::endl;
  return static_cast<int>(result.code);
}

int usage_error(const std::string& message) {
  std::cerr << "error: " << message << std::endl;
  return 64;
}

std::optional<warden::crypto::keypair> load_key(const std::string& path) {
  auto stream = std::ifstream{path};
  if (!stream) {
    return std::nullopt;
  }
  auto hex = std::string{};
  stream >> hex;
  auto seed = try_from_hex(hex);
  if (!seed.has_value()) {
    return std::nullopt;
  }
  return warden::crypto::keypair::from_private_key(bytes_view_t{*seed});
}

std::optional<entity_ref_t> target_entity(const warden::config::settings& s) {
  auto kind = try_from_string<entity_kind_t>(s.kind);
  if (!kind.has_value() || !s.entity.has_value()) {
    return std::nullopt;
  }
  auto hash = try_make_hash32(*s.entity);
  if (!hash.has_value()) {
    return std::nullopt;
  }
  return entity_ref_t{*kind, *hash};
}

std::optional<std::vector<agent_key_t>> agent_keys(context& ctx) {
  auto keys = std::vector<agent_key_t>{};
  for (const auto& hex : ctx.settings.agents) {
    auto agent = try_make_agent_key(hex);
    if (!agent.has_value()) {
      return std::nullopt;
    }
    keys.push_back(*agent);
  }
  if (keys.empty()) {
    keys.push_back(ctx.engine.agent());
  }
  return keys;
}

/// Chain root and superseded record; the current tip unless given.
struct chain_position final {
  hash32_t original{};
  hash32_t previous{};
};

std::optional<hash32_t> override_hash(const std::optional<std::string>& hex,
                                      const hash32_t& fallback) {
  if (!hex.has_value()) {
    return fallback;
  }
  return try_make_hash32(*hex);
}

void print_status(const status_entry_t& entry) {
  const auto& record = entry.record;
  std::cout << to_hex(entry.hash) << " depth=" << record.depth
            << " status=\"" << to_string(record.payload.status_type) << "\""
            << " author=" << to_hex(record.author)
            << " at=" << record.created_at;
  if (record.payload.reason.has_value()) {
    std::cout << " reason=\"" << *record.payload.reason << "\"";
  }
  if (record.payload.suspended_until.has_value()) {
    std::cout << " until=" << *record.payload.suspended_until;
  }
  std::cout << std::endl;
}

int with_entity(context& ctx,
                const std::function<int(const entity_ref_t&)>& run) {
  auto entity = target_entity(ctx.settings);
  if (!entity.has_value()) {
    return usage_error("--kind and a 64 hex character --entity are required");
  }
  return run(*entity);
}

int with_position(
    context& ctx,
    const std::function<int(const entity_ref_t&, const chain_position&)>& run) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto latest = ctx.engine.get_latest_status(entity);
    if (!latest) {
      return report(latest);
    }
    auto original = override_hash(ctx.settings.original,
                                  latest.value->record.original_hash);
    auto previous =
        override_hash(ctx.settings.previous, latest.value->hash);
    if (!original.has_value() || !previous.has_value()) {
      return usage_error("--original and --previous take 64 hex characters");
    }
    return run(entity, chain_position{*original, *previous});
  });
}

int print_hash(const operation_result<hash32_t>& result) {
  if (result) {
    std::cout << to_hex(*result.value) << std::endl;
  }
  return report(result);
}

int print_flag(const operation_result<bool>& result) {
  if (result) {
    std::cout << (*result.value ? "true" : "false") << std::endl;
  }
  return report(result);
}

int print_hashes(const operation_result<std::vector<hash32_t>>& result) {
  if (result) {
    for (const auto& hash : *result.value) {
      std::cout << to_hex(hash) << std::endl;
    }
  }
  return report(result);
}

int run_create_status(context& ctx) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto keys = agent_keys(ctx);
    if (!keys.has_value()) {
      return usage_error("--agent must be 64 hex characters");
    }
    return print_hash(ctx.engine.create_status(entity, *keys));
  });
}

int run_update_status(context& ctx) {
  return with_position(ctx, [&](const entity_ref_t& entity,
                                const chain_position& position) {
    if (!ctx.settings.status.has_value()) {
      return usage_error("--status is required");
    }
    auto name = *ctx.settings.status;
    std::replace(std::begin(name), std::end(name), '_', ' ');
    auto type = try_from_string<status_type_t>(name);
    if (!type.has_value()) {
      return usage_error("unknown status " + *ctx.settings.status);
    }
    auto request = warden::lifecycle::transition_request{};
    request.status_type = *type;
    request.reason = ctx.settings.reason;
    request.suspended_until = ctx.settings.until;
    if (ctx.settings.days.has_value() && !request.suspended_until) {
      request.suspended_until = warden::execution::system_clock_now() +
                                kMillisecondsPerDay * *ctx.settings.days;
    }
    return print_hash(ctx.engine.update_status(entity, position.original,
                                               position.previous, request));
  });
}

int run_suspend(context& ctx) {
  return with_position(ctx, [&](const entity_ref_t& entity,
                                const chain_position& position) {
    auto reason = ctx.settings.reason.value_or("");
    if (ctx.settings.days.has_value()) {
      return print_hash(ctx.engine.suspend_temporarily(
          entity, position.original, position.previous, reason,
          *ctx.settings.days));
    }
    return print_hash(ctx.engine.suspend_indefinitely(
        entity, position.original, position.previous, reason));
  });
}

int run_unsuspend(context& ctx) {
  return with_position(ctx, [&](const entity_ref_t& entity,
                                const chain_position& position) {
    return print_hash(
        ctx.engine.unsuspend(entity, position.original, position.previous));
  });
}

int run_unsuspend_if_expired(context& ctx) {
  return with_position(ctx, [&](const entity_ref_t& entity,
                                const chain_position& position) {
    return print_flag(ctx.engine.unsuspend_if_expired(
        entity, position.original, position.previous));
  });
}

int run_status(context& ctx) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto latest = ctx.engine.get_latest_status(entity);
    if (latest) {
      print_status(*latest.value);
    }
    return report(latest);
  });
}

int run_history(context& ctx) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto entries = ctx.engine.get_status_history(entity);
    if (entries) {
      for (const auto& entry : *entries.value) {
        print_status(entry);
      }
    }
    return report(entries);
  });
}

int run_forks(context& ctx) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto found = ctx.engine.get_status_forks(entity);
    if (found) {
      for (const auto& fork : *found.value) {
        std::cout << to_hex(fork.previous_hash) << ":";
        for (const auto& branch : fork.branches) {
          std::cout << " " << to_hex(branch);
        }
        std::cout << std::endl;
      }
    }
    return report(found);
  });
}

int run_list(context& ctx) {
  auto kind = try_from_string<entity_kind_t>(ctx.settings.kind);
  if (!kind.has_value()) {
    return usage_error("unknown kind " + ctx.settings.kind);
  }
  if (!ctx.settings.category.has_value()) {
    return print_hashes(ctx.engine.list_all_entities(*kind));
  }
  auto category = try_from_string<status_category_t>(*ctx.settings.category);
  if (!category.has_value()) {
    return usage_error("unknown category " + *ctx.settings.category);
  }
  return print_hashes(ctx.engine.list_entities_by_category(*kind, *category));
}

int run_rebuild_index(context& ctx) {
  auto rebuilt = ctx.engine.rebuild_index_from_chains();
  if (rebuilt) {
    std::cout << *rebuilt.value << std::endl;
  }
  return report(rebuilt);
}

int run_bootstrap(context& ctx) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto keys = agent_keys(ctx);
    if (!keys.has_value()) {
      return usage_error("--agent must be 64 hex characters");
    }
    return print_hash(ctx.engine.bootstrap_administrator(entity, *keys));
  });
}

int run_register_admin(context& ctx) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto keys = agent_keys(ctx);
    if (!keys.has_value()) {
      return usage_error("--agent must be 64 hex characters");
    }
    return print_hash(ctx.engine.register_administrator(entity, *keys));
  });
}

int run_remove_admin(context& ctx) {
  return with_entity(ctx, [&](const entity_ref_t& entity) {
    auto keys = std::vector<agent_key_t>{};
    for (const auto& hex : ctx.settings.agents) {
      auto agent = try_make_agent_key(hex);
      if (!agent.has_value()) {
        return usage_error("--agent must be 64 hex characters");
      }
      keys.push_back(*agent);
    }
    return print_hash(
        ctx.engine.remove_administrator(entity, keys, ctx.settings.reason));
  });
}

int run_is_admin(context& ctx) {
  if (ctx.settings.entity.has_value()) {
    return with_entity(ctx, [&](const entity_ref_t& entity) {
      return print_flag(ctx.engine.is_entity_administrator(entity));
    });
  }
  auto keys = agent_keys(ctx);
  if (!keys.has_value()) {
    return usage_error("--agent must be 64 hex characters");
  }
  return print_flag(ctx.engine.is_agent_administrator(keys->front()));
}

int run_export_replica(context& ctx) {
  if (!ctx.settings.file.has_value()) {
    return usage_error("--file is required");
  }
  auto replica = ctx.engine.export_replica();
  if (!replica) {
    return report(replica);
  }
  auto encoded = ctx.encoder.encode(*replica.value);
  auto stream = std::ofstream{*ctx.settings.file, std::ios::binary};
  stream.write(reinterpret_cast<const char*>(encoded.data()),
               static_cast<std::streamsize>(encoded.size()));
  if (!stream) {
    return usage_error("cannot write " + *ctx.settings.file);
  }
  std::cout << encoded.size() << " bytes" << std::endl;
  return 0;
}

int run_import_replica(context& ctx) {
  if (!ctx.settings.file.has_value()) {
    return usage_error("--file is required");
  }
  auto stream = std::ifstream{*ctx.settings.file, std::ios::binary};
  if (!stream) {
    return usage_error("cannot read " + *ctx.settings.file);
  }
  auto encoded = bytes_t{std::istreambuf_iterator<char>{stream},
                         std::istreambuf_iterator<char>{}};
  auto replica = ctx.encoder.try_decode<replica_t>(bytes_view_t{encoded});
  if (!replica.has_value()) {
    return usage_error(*ctx.settings.file + " is not a replica");
  }
  auto imported = ctx.engine.import_replica(*replica);
  if (imported) {
    std::cout << *imported.value << std::endl;
  }
  return report(imported);
}

const std::map<std::string, handler_t>& handlers() {
  static const auto table = std::map<std::string, handler_t>{
      {"whoami",
       [](context& ctx) {
         std::cout << to_hex(ctx.engine.agent()) << std::endl;
         return 0;
       }},
      {"create-status", run_create_status},
      {"update-status", run_update_status},
      {"suspend", run_suspend},
      {"unsuspend", run_unsuspend},
      {"unsuspend-if-expired", run_unsuspend_if_expired},
      {"status", run_status},
      {"history", run_history},
      {"forks", run_forks},
      {"list", run_list},
      {"rebuild-index", run_rebuild_index},
      {"bootstrap", run_bootstrap},
      {"register-admin", run_register_admin},
      {"remove-admin", run_remove_admin},
      {"is-admin", run_is_admin},
      {"export", run_export_replica},
      {"import", run_import_replica},
  };
  return table;
}

int run_keygen(const warden::config::settings& settings) {
  if (std::filesystem::exists(settings.key_path)) {
    return usage_error(settings.key_path + " already exists");
  }
  auto key = warden::crypto::keypair::generate();
  auto stream = std::ofstream{settings.key_path};
  stream << to_hex(bytes_view_t{key.private_key()}) << std::endl;
  if (!stream) {
    return usage_error("cannot write " + settings.key_path);
  }
  auto permissions_error = std::error_code{};
  std::filesystem::permissions(
      settings.key_path,
      std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      permissions_error);
  if (permissions_error) {
    spdlog::warn("could not restrict permissions of {}: {}",
                 settings.key_path, permissions_error.message());
  }
  spdlog::info("wrote key for agent {} to {}", to_hex(key.public_key()),
               settings.key_path);
  std::cout << to_hex(key.public_key()) << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto settings = warden::config::parse(argc, argv, error);
  if (!settings.has_value()) {
    return usage_error(error);
  }
  if (settings->help) {
    std::cout << settings->help_text << std::endl;
    return 0;
  }
  if (!warden::common::configure_logging(settings->log_level,
                                         settings->log_file)) {
    return usage_error("unknown log level " + settings->log_level);
  }
  if (!warden::crypto::available()) {
    spdlog::critical("OpenSSL was built without ed25519 support");
    spdlog::shutdown();
    return 70;
  }

  auto code = 0;
  if (settings->command == "keygen") {
    code = run_keygen(*settings);
  } else {
    auto handler = handlers().find(settings->command);
    if (handler == handlers().end()) {
      code = usage_error("unknown command " + settings->command);
    } else {
      auto key = load_key(settings->key_path);
      if (!key.has_value()) {
        code = usage_error("cannot load key from " + settings->key_path +
                           "; run `warden keygen` first");
      } else {
        auto encoder = warden::chain::encoder_t{};
        auto storage = warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(settings->db_path);
        auto options = warden::execution::engine_options{};
        options.progenitor = settings->progenitor;
        auto engine = warden::execution::engine{encoder, storage, *key, options};
        auto ctx = context{*settings, engine, encoder};
        code = handler->second(ctx);
      }
    }
  }

  spdlog::shutdown();
  return code;
}
