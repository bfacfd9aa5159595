#include "internal/service/pool_service.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <string>

#include "internal/archive/zip_reader.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using credpool::model::AssignmentType;
using credpool::runtime::config::RuntimeConfig;
using credpool::service::PoolService;
using credpool::testing::ZipOf;

credpool::factory::Application MemoryApp() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_server_defaults()->set_dns_servers("1.1.1.1");
  credpool::config::ConfigLoader::ApplyDefaults(config);
  return credpool::factory::Build(config);
}

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

std::map<std::string, std::string> Unpack(const std::string& archive) {
  std::map<std::string, std::string> out;
  credpool::archive::ZipReader       reader(archive);
  for (const auto& entry : reader.Entries()) {
    out[entry.name] = reader.Read(entry, 1 << 20);
  }
  return out;
}

void TestImportRequestAndExport() {
  auto  app     = MemoryApp();
  auto& service = *app.pool_service;

  auto imported = service.ImportArchive(ZipOf(0, 6), {}, AssignmentType::kUserRequestable);
  assert(imported.imported == 6);

  auto claim = service.RequestCredentials(11, "alice", 2);
  assert(claim.assigned_count == 2);
  assert(claim.request_batch_id.has_value());

  auto bundle = service.ExportBatch(11, "alice", *claim.request_batch_id);
  assert(bundle.filenames.size() == 2);
  assert(bundle.has_manifest);
  for (const auto& name : bundle.filenames) {
    assert(name.rfind("simnet_10.8.0.", 0) == 0);
  }

  auto files = Unpack(bundle.archive);
  assert(files.size() == 3);
  for (const auto& name : bundle.filenames) {
    assert(files[name].find("DNS = 1.1.1.1\n") != std::string::npos);
  }

  service.SetNamingPattern("{username}_{index}");
  auto all = service.ExportUser(11, "alice");
  assert(all.filenames.size() == 2);
  assert(all.filenames[0] == "alice_1.conf");
  assert(all.filenames[1] == "alice_2.conf");
}

void TestRenderAppliesOverridesLast() {
  auto  app     = MemoryApp();
  auto& service = *app.pool_service;

  service.ImportArchive(ZipOf(0, 1), {}, AssignmentType::kUserRequestable);
  const auto id = service.List({}).items.front().id;

  service.SetServerDefault("dns_servers", "9.9.9.9");
  auto text = service.RenderConfig(id);
  assert(text.find("DNS = 9.9.9.9\n") != std::string::npos);

  credpool::model::ServerDefaults overrides;
  overrides.dns_servers = "10.0.0.53";
  text = service.RenderConfig(id, overrides);
  assert(text.find("DNS = 10.0.0.53\n") != std::string::npos);

  // credential's own values beat any default
  assert(text.find("AllowedIPs = 0.0.0.0/0\n") != std::string::npos);

  assert(Throws<credpool::util::NotFound>([&] { service.RenderConfig(999); }));
}

void TestEmptyExportsAreNotFound() {
  auto  app     = MemoryApp();
  auto& service = *app.pool_service;

  service.ImportArchive(ZipOf(0, 2), {}, AssignmentType::kUserRequestable);
  assert(Throws<credpool::util::NotFound>([&] { service.ExportUser(5, "bob"); }));
  assert(Throws<credpool::util::NotFound>([&] { service.ExportBatch(5, "bob", "missing"); }));

  auto claim = service.RequestCredentials(5, "bob", 1);
  assert(claim.assigned_count == 1);
  assert(Throws<credpool::util::NotFound>([&] { service.ExportBatch(6, "eve", *claim.request_batch_id); }));

  service.RevokeUser(5);
  assert(Throws<credpool::util::NotFound>([&] { service.ExportUser(5, "bob"); }));
}

void TestStatsTrackEveryPool() {
  auto  app     = MemoryApp();
  auto& service = *app.pool_service;

  service.ImportArchive(ZipOf(0, 3), {}, AssignmentType::kUserRequestable);
  service.ImportArchive(ZipOf(10, 2), "gw.example.net:51820", AssignmentType::kInstanceAutoAssign);

  auto instance = service.ClaimForInstance(int64_t{42});
  assert(instance.assigned_count == 1);
  assert(instance.credentials.front().material.endpoint == "gw.example.net:51820");

  service.RequestCredentials(1, "alice", 1);

  auto stats = service.Stats();
  assert(stats.total == 5);
  for (const auto& pool : stats.pools) {
    if (pool.type == AssignmentType::kUserRequestable) {
      assert(pool.total == 3 && pool.available == 2 && pool.assigned == 1);
    } else if (pool.type == AssignmentType::kInstanceAutoAssign) {
      assert(pool.total == 2 && pool.available == 1 && pool.assigned == 1);
    } else {
      assert(pool.total == 0);
    }
  }

  assert(service.RevokeInstance(42) == 1);
  assert(service.DeleteAll() == 5);
  assert(service.Stats().total == 0);
}

void TestFailuresPropagateUnchanged() {
  auto  app     = MemoryApp();
  auto& service = *app.pool_service;

  assert(Throws<credpool::util::InvalidArgument>([&] { service.SetAssignmentType(1, "bogus"); }));
  assert(Throws<credpool::util::InvalidArgument>([&] { service.SetNamingPattern(""); }));
  assert(Throws<credpool::util::InvalidArgument>([&] { service.SetServerDefault("nope", "x"); }));
  assert(Throws<credpool::util::NotFound>([&] { service.Release(3); }));
}

} // namespace

int main() {
  TestImportRequestAndExport();
  TestRenderAppliesOverridesLast();
  TestEmptyExportsAreNotFound();
  TestStatsTrackEveryPool();
  TestFailuresPropagateUnchanged();

  std::cout << "credpool_unit_pool_service: pass\n";
  return 0;
}
