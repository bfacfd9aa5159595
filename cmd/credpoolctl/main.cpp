#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/settings_store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

using credpool::db::model::CredentialRecord;
using credpool::model::AssignmentType;

static void Usage() {
  std::cout << "Usage:\n"
            << "  credpoolctl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  import <archive.zip> [pool] [endpoint_override]\n"
            << "  request <user_id> <username> <count>\n"
            << "  claim-instance [instance_id]\n"
            << "  link <credential_id> <instance_id>\n"
            << "  bulk-assign <count_per_user> <user_id:username>...\n"
            << "  release <credential_id>\n"
            << "  revoke-user <user_id>\n"
            << "  revoke-instance <instance_id>\n"
            << "  set-type <pool> <credential_id>...\n"
            << "  delete <credential_id>...\n"
            << "  delete-all\n"
            << "  show <credential_id>\n"
            << "  render <credential_id>\n"
            << "  export-user <user_id> <username> <out.zip>\n"
            << "  export-batch <user_id> <username> <batch_id> <out.zip>\n"
            << "  list [--pool P] [--available|--assigned|--inactive] [--user ID] [--instance ID]\n"
            << "       [--batch ID] [--search TEXT] [--limit N] [--offset N]\n"
            << "  batches <user_id>\n"
            << "  stats\n"
            << "  naming-pattern [pattern]\n"
            << "  server-defaults\n"
            << "  server-default <key> <value>\n"
            << "\n"
            << "pool: USER_REQUESTABLE | INSTANCE_AUTO_ASSIGN | RESERVED\n";
}

static int64_t ParseBounded(const std::string& value, const char* what, int64_t min, int64_t max) {
  auto parsed = credpool::util::ParseInt(value, min, max);
  if (!parsed) {
    throw credpool::util::InvalidArgument(std::string("invalid ") + what + ": '" + value + "' (expected " +
                                          std::to_string(min) + ".." + std::to_string(max) + ")");
  }
  return *parsed;
}

static int64_t ParseId(const std::string& value, const char* what) {
  return ParseBounded(value, what, 0, std::numeric_limits<int64_t>::max());
}

static int32_t ParseCount(const std::string& value) {
  return static_cast<int32_t>(ParseBounded(value, "count", 1, std::numeric_limits<int32_t>::max()));
}

static uint32_t ParsePaging(const std::string& value, const char* what) {
  return static_cast<uint32_t>(ParseBounded(value, what, 0, std::numeric_limits<uint32_t>::max()));
}

static AssignmentType ParsePool(const std::string& value) {
  auto parsed = credpool::model::ParseAssignmentType(value);
  if (!parsed) {
    throw credpool::util::InvalidArgument("unsupported pool: " + value);
  }
  return *parsed;
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw credpool::util::InvalidArgument("cannot open " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void WriteFile(const std::string& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw std::runtime_error("cannot write " + path);
  }
}

static void PrintCredential(const CredentialRecord& r) {
  std::cout << "id=" << r.id << " pool=" << credpool::model::ToString(r.assignment_type)
            << " ipv4=" << (r.material.ipv4_address.empty() ? "-" : r.material.ipv4_address)
            << " endpoint=" << r.material.endpoint << " available=" << (r.is_available ? "true" : "false")
            << " active=" << (r.is_active ? "true" : "false");
  if (r.assigned_to_user_id) {
    std::cout << " user=" << *r.assigned_to_user_id;
    if (!r.assigned_to_username.empty()) std::cout << "(" << r.assigned_to_username << ")";
  }
  if (r.assigned_to_instance_id) std::cout << " instance=" << *r.assigned_to_instance_id;
  if (r.request_batch_id) std::cout << " batch=" << *r.request_batch_id;
  if (r.assigned_at_ms != 0) std::cout << " assigned_at=" << credpool::util::FormatUnixMillis(r.assigned_at_ms);
  std::cout << "\n";
}

static void PrintClaim(const credpool::core::ClaimResult& result) {
  std::cout << "requested=" << result.requested_count << " assigned=" << result.assigned_count << "\n";
  std::cout << "message=" << result.message << "\n";
  if (result.request_batch_id) std::cout << "batch=" << *result.request_batch_id << "\n";
  for (const auto& credential : result.credentials) PrintCredential(credential);
}

static void PrintErrors(const std::vector<std::string>& errors) {
  for (const auto& error : errors) std::cout << "error: " << error << "\n";
}

static credpool::runtime::config::RuntimeConfig LoadConfig(const std::optional<std::string>& path) {
  if (path) {
    return credpool::config::ConfigLoader::LoadFromYaml(*path);
  }

  credpool::runtime::config::RuntimeConfig config;
#if CREDPOOL_DB_SQLITE
  config.mutable_database()->mutable_sqlite()->set_path("credpool.db");
#endif
  credpool::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

static int Run(credpool::service::PoolService& svc, const std::vector<std::string>& args) {
  const auto& cmd  = args[0];
  const auto  argc = args.size();

  // ------------------------------------------------------------

  if (cmd == "import") {
    if (argc < 2) return 1;

    const auto archive  = ReadFile(args[1]);
    const auto pool     = argc >= 3 ? ParsePool(args[2]) : AssignmentType::kUserRequestable;
    const auto endpoint = argc >= 4 ? args[3] : std::string();

    auto result = svc.ImportArchive(archive, endpoint, pool);
    std::cout << "imported=" << result.imported << " skipped=" << result.skipped << " failed=" << result.failed
              << " ignored=" << result.ignored << "\n";
    PrintErrors(result.errors);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 4) return 1;

    const auto count = ParseCount(args[3]);
    PrintClaim(svc.RequestCredentials(ParseId(args[1], "user id"), args[2], count));
    return 0;
  }

  if (cmd == "claim-instance") {
    std::optional<int64_t> instance_id;
    if (argc >= 2) instance_id = ParseId(args[1], "instance id");

    PrintClaim(svc.ClaimForInstance(instance_id));
    return 0;
  }

  if (cmd == "link") {
    if (argc < 3) return 1;

    PrintCredential(svc.LinkInstance(ParseId(args[1], "credential id"), ParseId(args[2], "instance id")));
    return 0;
  }

  if (cmd == "bulk-assign") {
    if (argc < 3) return 1;

    const auto count = ParseCount(args[1]);

    std::vector<credpool::core::BulkAssignTarget> targets;
    for (size_t i = 2; i < argc; ++i) {
      const auto colon = args[i].find(':');
      credpool::core::BulkAssignTarget target;
      target.user_id = ParseId(args[i].substr(0, colon), "user id");
      if (colon != std::string::npos) target.username = args[i].substr(colon + 1);
      targets.push_back(std::move(target));
    }

    auto result = svc.BulkAssign(targets, count);
    std::cout << "assigned=" << result.total_assigned << " failed_users=" << result.failed_user_ids.size() << "\n";
    PrintErrors(result.errors);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "release") {
    if (argc < 2) return 1;

    PrintCredential(svc.Release(ParseId(args[1], "credential id")));
    return 0;
  }

  if (cmd == "revoke-user") {
    if (argc < 2) return 1;

    std::cout << "revoked=" << svc.RevokeUser(ParseId(args[1], "user id")) << "\n";
    return 0;
  }

  if (cmd == "revoke-instance") {
    if (argc < 2) return 1;

    std::cout << "revoked=" << svc.RevokeInstance(ParseId(args[1], "instance id")) << "\n";
    return 0;
  }

  if (cmd == "set-type") {
    if (argc < 3) return 1;

    if (argc == 3) {
      PrintCredential(svc.SetAssignmentType(ParseId(args[2], "credential id"), args[1]));
      return 0;
    }

    std::vector<int64_t> ids;
    for (size_t i = 2; i < argc; ++i) ids.push_back(ParseId(args[i], "credential id"));

    auto result = svc.SetAssignmentTypes(ids, args[1]);
    std::cout << "updated=" << result.success_count << " skipped=" << result.skipped_count << "\n";
    PrintErrors(result.errors);
    return 0;
  }

  if (cmd == "delete") {
    if (argc < 2) return 1;

    std::vector<int64_t> ids;
    for (size_t i = 1; i < argc; ++i) ids.push_back(ParseId(args[i], "credential id"));

    auto result = svc.DeleteCredentials(ids);
    std::cout << "deleted=" << result.deleted_count << " failed=" << result.failed_ids.size() << "\n";
    PrintErrors(result.errors);
    return 0;
  }

  if (cmd == "delete-all") {
    std::cout << "deleted=" << svc.DeleteAll() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (argc < 2) return 1;

    PrintCredential(svc.Get(ParseId(args[1], "credential id")));
    return 0;
  }

  if (cmd == "render") {
    if (argc < 2) return 1;

    std::cout << svc.RenderConfig(ParseId(args[1], "credential id"));
    return 0;
  }

  if (cmd == "export-user") {
    if (argc < 4) return 1;

    auto bundle = svc.ExportUser(ParseId(args[1], "user id"), args[2]);
    WriteFile(args[3], bundle.archive);
    std::cout << "files=" << bundle.filenames.size() << " manifest=" << (bundle.has_manifest ? "true" : "false")
              << "\n";
    return 0;
  }

  if (cmd == "export-batch") {
    if (argc < 5) return 1;

    auto bundle = svc.ExportBatch(ParseId(args[1], "user id"), args[2], args[3]);
    WriteFile(args[4], bundle.archive);
    std::cout << "files=" << bundle.filenames.size() << " manifest=" << (bundle.has_manifest ? "true" : "false")
              << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    credpool::db::model::CredentialFilter filter;
    for (size_t i = 1; i < argc; ++i) {
      const auto& flag     = args[i];
      const bool  has_next = i + 1 < argc;
      if (flag == "--available") {
        filter.is_available = true;
        filter.is_active    = true;
      } else if (flag == "--assigned") {
        filter.is_available = false;
        filter.is_active    = true;
      } else if (flag == "--inactive") {
        filter.is_active = false;
      } else if (flag == "--pool" && has_next) {
        filter.assignment_type = ParsePool(args[++i]);
      } else if (flag == "--user" && has_next) {
        filter.user_id = ParseId(args[++i], "user id");
      } else if (flag == "--instance" && has_next) {
        filter.instance_id = ParseId(args[++i], "instance id");
      } else if (flag == "--batch" && has_next) {
        filter.request_batch_id = args[++i];
      } else if (flag == "--search" && has_next) {
        filter.search = args[++i];
      } else if (flag == "--limit" && has_next) {
        filter.limit = ParsePaging(args[++i], "limit");
      } else if (flag == "--offset" && has_next) {
        filter.offset = ParsePaging(args[++i], "offset");
      } else {
        std::cerr << "unknown list option: " << flag << "\n";
        return 1;
      }
    }

    auto page = svc.List(filter);
    std::cout << "total=" << page.total << "\n";
    for (const auto& credential : page.items) PrintCredential(credential);
    return 0;
  }

  if (cmd == "batches") {
    if (argc < 2) return 1;

    for (const auto& batch : svc.ListBatches(ParseId(args[1], "user id"))) {
      std::cout << "batch=" << batch.request_batch_id
                << " first_assigned=" << credpool::util::FormatUnixMillis(batch.first_assigned_at_ms)
                << " count=" << batch.credential_count << "\n";
    }
    return 0;
  }

  if (cmd == "stats") {
    auto stats = svc.Stats();
    std::cout << "total=" << stats.total << "\n";
    for (const auto& pool : stats.pools) {
      std::cout << credpool::model::ToString(pool.type) << " total=" << pool.total << " available=" << pool.available
                << " assigned=" << pool.assigned << " inactive=" << pool.inactive << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "naming-pattern") {
    if (argc >= 2) svc.SetNamingPattern(args[1]);
    std::cout << "naming_pattern=" << svc.NamingPattern() << "\n";
    return 0;
  }

  if (cmd == "server-defaults") {
    const auto defaults = svc.ResolvedServerDefaults();
    std::cout << credpool::core::kServerPublicKeyKey << "=" << defaults.public_key << "\n"
              << credpool::core::kDnsServersKey << "=" << defaults.dns_servers << "\n"
              << credpool::core::kAllowedIpsKey << "=" << defaults.allowed_ips << "\n"
              << credpool::core::kMtuKey << "=" << defaults.mtu << "\n"
              << credpool::core::kPersistentKeepaliveKey << "=" << defaults.persistent_keepalive << "\n";
    return 0;
  }

  if (cmd == "server-default") {
    if (argc < 3) return 1;

    svc.SetServerDefault(args[1], args[2]);
    std::cout << args[1] << "=" << args[2] << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::vector<std::string>   args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      Usage();
      return 0;
    } else {
      args.push_back(std::move(arg));
    }
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  int rc = 0;
  try {
    auto config = LoadConfig(config_path);

    credpool::observability::InitializeTracing(config);
    credpool::observability::InitializeMetrics(config);
    credpool::observability::InitializeLogging(config);

    auto app = credpool::factory::Build(config);
    rc       = Run(*app.pool_service, args);
    if (rc == 1) Usage();
  } catch (const credpool::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    rc = 3;
  } catch (const credpool::util::InvalidArgument& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
    rc = 4;
  } catch (const credpool::util::InvalidState& e) {
    std::cerr << "invalid state: " << e.what() << "\n";
    rc = 5;
  } catch (const credpool::util::Unavailable& e) {
    std::cerr << "unavailable: " << e.what() << "\n";
    rc = 6;
  } catch (const std::exception& e) {
    CREDPOOL_LOG_ERROR("Fatal error", {credpool::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    rc = 2;
  }

  credpool::observability::ShutdownLogging();
  credpool::observability::ShutdownMetrics();
  credpool::observability::ShutdownTracing();
  return rc;
}
