#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using credpool::config::ConfigLoader;
using credpool::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "credpool_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\credpool\\\"quoted\"\\db.sqlite"
    busy_timeout_ms: 250
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\credpool\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(database:
  memory: {}
naming:
  default_pattern: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.naming().default_pattern() == std::string("line1\nline2☃"));
}

void TestDefaultsFillUnsetFields() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(database:
  sqlite: {}
server_defaults:
  public_key: "c2VydmVy"
  mtu: 1420
allocator:
  max_request_count: 10
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "credpool.db");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);

  assert(config.server_defaults().public_key() == "c2VydmVy");
  assert(config.server_defaults().mtu() == 1420);
  assert(config.server_defaults().persistent_keepalive() == 0);

  assert(config.allocator().max_claim_attempts() == 3);
  assert(config.allocator().max_request_count() == 10);

  assert(config.importer().max_archive_bytes() == 50ull * 1024 * 1024);
  assert(config.importer().max_entry_bytes() == 1024ull * 1024);
  assert(config.importer().max_reported_errors() == 10);

  assert(config.naming().default_pattern() == "simnet_{ipv4_address}.conf");
}

void TestMissingDatabaseSelectsMemory() {
  const auto yaml_path = WriteYaml("no_database",
                                   R"(logging:
  level: "debug"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
  assert(config.logging().level() == "debug");
}

void TestPostgresRequiresConnectionUri() {
  const auto yaml_path = WriteYaml("postgres_no_uri",
                                   R"(database:
  postgres:
    max_connections: 4
)");

  assert(LoadThrows(yaml_path) && "postgres without a connection uri must be rejected.");

  const auto ok_path = WriteYaml("postgres_uri",
                                 R"(database:
  postgres:
    connection_uri: "postgresql://credpool@localhost/credpool"
)");
  auto config = ConfigLoader::LoadFromYaml(ok_path.string());
  assert(config.database().postgres().max_connections() == 16);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  assert(LoadThrows(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  assert(LoadThrows(std::filesystem::temp_directory_path() / "credpool_config_loader_tests" / "absent.yaml"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestDefaultsFillUnsetFields();
  TestMissingDatabaseSelectsMemory();
  TestPostgresRequiresConnectionUri();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "credpool_unit_config_loader: pass\n";
  return 0;
}
