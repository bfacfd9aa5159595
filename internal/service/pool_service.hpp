#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/assignment_type_manager.hpp"
#include "internal/core/credential_lifecycle.hpp"
#include "internal/core/pool_allocator.hpp"
#include "internal/exporter/bundle_exporter.hpp"
#include "internal/importer/import_pipeline.hpp"
#include "internal/model/network_material.hpp"
#include "service_context.hpp"

namespace credpool::service {

/*
  Entry point for every credential pool operation.

  Each call is traced, counted and timed under its route name
  ("PoolService.<Op>"); failures are logged and rethrown unchanged.
  No call partially commits, so all of them are safe to retry.
*/
class PoolService {
 public:
  explicit PoolService(ServiceContext ctx);

  // Claims
  core::ClaimResult RequestCredentials(int64_t user_id, const std::string& username, int32_t count);
  core::ClaimResult Claim(const core::ClaimRequest& request);
  core::ClaimResult ClaimForInstance(std::optional<int64_t> instance_id);
  core::BulkAssignResult BulkAssign(const std::vector<core::BulkAssignTarget>& targets, int32_t count_per_user);

  db::model::CredentialRecord LinkInstance(int64_t credential_id, int64_t instance_id);
  db::model::CredentialRecord Release(int64_t credential_id);

  uint32_t RevokeUser(int64_t user_id);
  uint32_t RevokeInstance(int64_t instance_id);

  // Pool administration
  db::model::CredentialRecord SetAssignmentType(int64_t credential_id, std::string_view type_name);
  core::AssignmentTypeBulkResult SetAssignmentTypes(const std::vector<int64_t>& credential_ids,
                                                    std::string_view type_name);

  core::DeleteResult DeleteCredentials(const std::vector<int64_t>& credential_ids);
  uint32_t           DeleteAll();

  importer::ImportResult ImportArchive(std::string_view archive, std::string_view endpoint_override,
                                       credpool::model::AssignmentType type);

  // Output. overrides win over the stored server defaults.
  std::string RenderConfig(int64_t credential_id, const credpool::model::ServerDefaults& overrides = {});

  // Active credentials of the user; util::NotFound when there are none.
  exporter::ExportBundle ExportUser(int64_t user_id, const std::string& username,
                                    const credpool::model::ServerDefaults& overrides = {});

  exporter::ExportBundle ExportBatch(int64_t user_id, const std::string& username, const std::string& batch_id,
                                     const credpool::model::ServerDefaults& overrides = {});

  // Queries
  db::model::CredentialRecord              Get(int64_t credential_id);
  core::CredentialStats                    Stats();
  core::CredentialPage                     List(const db::model::CredentialFilter& filter);
  std::vector<db::model::BatchSummary>     ListBatches(int64_t user_id);
  std::vector<db::model::CredentialRecord> ListBatch(int64_t user_id, const std::string& batch_id);

  // Settings
  std::string                     NamingPattern();
  void                            SetNamingPattern(const std::string& pattern);
  credpool::model::ServerDefaults ResolvedServerDefaults();
  void                            SetServerDefault(std::string_view key, const std::string& value);

 private:
  exporter::ExportBundle Export(std::vector<db::model::CredentialRecord> credentials, int64_t user_id,
                                const std::string& username, const credpool::model::ServerDefaults& overrides);

  ServiceContext ctx_;
};

} // namespace credpool::service
