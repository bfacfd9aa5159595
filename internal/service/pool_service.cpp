#include "pool_service.hpp"

#include <chrono>
#include <cstdint>
#include <type_traits>

#include "internal/codec/wireguard_config.hpp"
#include "internal/core/settings_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace credpool::service {

namespace {

// fn may take the span to annotate it.
template <typename Fn>
decltype(auto) Invoke(Fn& fn, credpool::observability::SpanScope& span) {
  if constexpr (std::is_invocable_v<Fn&, credpool::observability::SpanScope&>) {
    return fn(span);
  } else {
    return fn();
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  credpool::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<decltype(Invoke(fn, span))>) {
      Invoke(fn, span);
      credpool::observability::Metrics::Instance().RecordRequest(route, true);
      credpool::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = Invoke(fn, span);
      credpool::observability::Metrics::Instance().RecordRequest(route, true);
      credpool::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CREDPOOL_LOG_ERROR("Request failed", {credpool::observability::StringField("route", route),
                                          credpool::observability::StringField("error", ex.what())});
    credpool::observability::Metrics::Instance().RecordRequest(route, false);
    credpool::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void RecordClaim(credpool::observability::SpanScope& span, credpool::model::AssignmentType pool,
                 const core::ClaimResult& result) {
  span.SetAttribute("credpool.pool", credpool::model::ToString(pool));
  span.SetAttribute("credpool.claim.requested", static_cast<std::int64_t>(result.requested_count));
  span.SetAttribute("credpool.claim.assigned", static_cast<std::int64_t>(result.assigned_count));
  if (result.request_batch_id) span.SetAttribute("credpool.batch_id", *result.request_batch_id);
  credpool::observability::Metrics::Instance().RecordClaim(credpool::model::ToString(pool), result.requested_count,
                                                           result.assigned_count);
}

} // namespace

PoolService::PoolService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

core::ClaimResult PoolService::RequestCredentials(int64_t user_id, const std::string& username, int32_t count) {
  return ObserveRpc("PoolService.RequestCredentials", [&](credpool::observability::SpanScope& span) {
    span.SetAttribute("credpool.user_id", user_id);
    auto result = ctx_.allocator->RequestForUser(user_id, username, count);
    RecordClaim(span, credpool::model::AssignmentType::kUserRequestable, result);
    return result;
  });
}

core::ClaimResult PoolService::Claim(const core::ClaimRequest& request) {
  return ObserveRpc("PoolService.Claim", [&](credpool::observability::SpanScope& span) {
    auto result = ctx_.allocator->Claim(request);
    RecordClaim(span, request.pool, result);
    return result;
  });
}

core::ClaimResult PoolService::ClaimForInstance(std::optional<int64_t> instance_id) {
  return ObserveRpc("PoolService.ClaimForInstance", [&](credpool::observability::SpanScope& span) {
    if (instance_id) span.SetAttribute("credpool.instance_id", *instance_id);
    auto result = ctx_.allocator->ClaimForInstance(instance_id);
    RecordClaim(span, credpool::model::AssignmentType::kInstanceAutoAssign, result);
    return result;
  });
}

core::BulkAssignResult PoolService::BulkAssign(const std::vector<core::BulkAssignTarget>& targets,
                                               int32_t count_per_user) {
  return ObserveRpc("PoolService.BulkAssign", [&] { return ctx_.allocator->BulkAssign(targets, count_per_user); });
}

db::model::CredentialRecord PoolService::LinkInstance(int64_t credential_id, int64_t instance_id) {
  return ObserveRpc("PoolService.LinkInstance", [&](credpool::observability::SpanScope& span) {
    span.SetAttribute("credpool.credential_id", credential_id);
    span.SetAttribute("credpool.instance_id", instance_id);
    return ctx_.allocator->LinkInstance(credential_id, instance_id);
  });
}

db::model::CredentialRecord PoolService::Release(int64_t credential_id) {
  return ObserveRpc("PoolService.Release", [&](credpool::observability::SpanScope& span) {
    span.SetAttribute("credpool.credential_id", credential_id);
    return ctx_.lifecycle->Release(credential_id);
  });
}

uint32_t PoolService::RevokeUser(int64_t user_id) {
  return ObserveRpc("PoolService.RevokeUser", [&] { return ctx_.lifecycle->RevokeUser(user_id); });
}

uint32_t PoolService::RevokeInstance(int64_t instance_id) {
  return ObserveRpc("PoolService.RevokeInstance", [&] { return ctx_.lifecycle->RevokeInstance(instance_id); });
}

db::model::CredentialRecord PoolService::SetAssignmentType(int64_t credential_id, std::string_view type_name) {
  return ObserveRpc("PoolService.SetAssignmentType",
                    [&] { return ctx_.assignment_types->SetAssignmentType(credential_id, type_name); });
}

core::AssignmentTypeBulkResult PoolService::SetAssignmentTypes(const std::vector<int64_t>& credential_ids,
                                                               std::string_view type_name) {
  return ObserveRpc("PoolService.SetAssignmentTypes",
                    [&] { return ctx_.assignment_types->SetAssignmentTypes(credential_ids, type_name); });
}

core::DeleteResult PoolService::DeleteCredentials(const std::vector<int64_t>& credential_ids) {
  return ObserveRpc("PoolService.DeleteCredentials",
                    [&] { return ctx_.lifecycle->DeleteCredentials(credential_ids); });
}

uint32_t PoolService::DeleteAll() {
  return ObserveRpc("PoolService.DeleteAll", [&] { return ctx_.lifecycle->DeleteAll(); });
}

importer::ImportResult PoolService::ImportArchive(std::string_view archive, std::string_view endpoint_override,
                                                  credpool::model::AssignmentType type) {
  return ObserveRpc("PoolService.ImportArchive", [&](credpool::observability::SpanScope& span) {
    span.SetAttribute("credpool.pool", credpool::model::ToString(type));
    span.SetAttribute("credpool.import.archive_bytes", static_cast<std::int64_t>(archive.size()));
    auto  result  = ctx_.importer->ImportArchive(archive, endpoint_override, type);
    span.SetAttribute("credpool.import.imported", static_cast<std::int64_t>(result.imported));
    auto& metrics = credpool::observability::Metrics::Instance();
    metrics.RecordImportEntries("imported", result.imported);
    metrics.RecordImportEntries("skipped", result.skipped);
    metrics.RecordImportEntries("failed", result.failed);
    metrics.RecordImportEntries("ignored", result.ignored);
    return result;
  });
}

std::string PoolService::RenderConfig(int64_t credential_id, const credpool::model::ServerDefaults& overrides) {
  return ObserveRpc("PoolService.RenderConfig", [&](credpool::observability::SpanScope& span) {
    span.SetAttribute("credpool.credential_id", credential_id);
    const auto credential = ctx_.lifecycle->Get(credential_id);
    return codec::GenerateWireGuardConfig(credential.material,
                                          core::Overlay(ctx_.settings->ResolvedServerDefaults(), overrides));
  });
}

exporter::ExportBundle PoolService::ExportUser(int64_t user_id, const std::string& username,
                                               const credpool::model::ServerDefaults& overrides) {
  return ObserveRpc("PoolService.ExportUser", [&] {
    db::model::CredentialFilter filter;
    filter.user_id   = user_id;
    filter.is_active = true;

    auto page = ctx_.lifecycle->List(filter);
    if (page.items.empty()) {
      throw util::NotFound("no credentials assigned to user " + std::to_string(user_id));
    }
    return Export(std::move(page.items), user_id, username, overrides);
  });
}

exporter::ExportBundle PoolService::ExportBatch(int64_t user_id, const std::string& username,
                                                const std::string& batch_id,
                                                const credpool::model::ServerDefaults& overrides) {
  return ObserveRpc("PoolService.ExportBatch", [&](credpool::observability::SpanScope& span) {
    span.SetAttribute("credpool.user_id", user_id);
    span.SetAttribute("credpool.batch_id", batch_id);
    auto credentials = ctx_.lifecycle->ListBatch(user_id, batch_id);
    if (credentials.empty()) {
      throw util::NotFound("batch " + batch_id + " not found for user " + std::to_string(user_id));
    }
    return Export(std::move(credentials), user_id, username, overrides);
  });
}

exporter::ExportBundle PoolService::Export(std::vector<db::model::CredentialRecord> credentials, int64_t user_id,
                                           const std::string& username,
                                           const credpool::model::ServerDefaults& overrides) {
  const naming::Requester requester{user_id, username};
  auto bundle = exporter::BuildBundle(credentials, ctx_.settings->NamingPattern(), requester,
                                      core::Overlay(ctx_.settings->ResolvedServerDefaults(), overrides));

  CREDPOOL_LOG_INFO("Exported bundle", {credpool::observability::IntField("user_id", user_id),
                                        credpool::observability::IntField("files", bundle.filenames.size()),
                                        credpool::observability::BoolField("manifest", bundle.has_manifest)});
  return bundle;
}

db::model::CredentialRecord PoolService::Get(int64_t credential_id) {
  return ObserveRpc("PoolService.Get", [&] { return ctx_.lifecycle->Get(credential_id); });
}

core::CredentialStats PoolService::Stats() {
  return ObserveRpc("PoolService.Stats", [&] {
    auto stats = ctx_.lifecycle->Stats();
    for (const auto& pool : stats.pools) {
      credpool::observability::Metrics::Instance().SetPoolAvailable(credpool::model::ToString(pool.type),
                                                                    pool.available);
    }
    return stats;
  });
}

core::CredentialPage PoolService::List(const db::model::CredentialFilter& filter) {
  return ObserveRpc("PoolService.List", [&] { return ctx_.lifecycle->List(filter); });
}

std::vector<db::model::BatchSummary> PoolService::ListBatches(int64_t user_id) {
  return ObserveRpc("PoolService.ListBatches", [&] { return ctx_.lifecycle->ListBatches(user_id); });
}

std::vector<db::model::CredentialRecord> PoolService::ListBatch(int64_t user_id, const std::string& batch_id) {
  return ObserveRpc("PoolService.ListBatch", [&] { return ctx_.lifecycle->ListBatch(user_id, batch_id); });
}

std::string PoolService::NamingPattern() {
  return ObserveRpc("PoolService.NamingPattern", [&] { return ctx_.settings->NamingPattern(); });
}

void PoolService::SetNamingPattern(const std::string& pattern) {
  ObserveRpc("PoolService.SetNamingPattern", [&] { ctx_.settings->SetNamingPattern(pattern); });
}

credpool::model::ServerDefaults PoolService::ResolvedServerDefaults() {
  return ObserveRpc("PoolService.ServerDefaults", [&] { return ctx_.settings->ResolvedServerDefaults(); });
}

void PoolService::SetServerDefault(std::string_view key, const std::string& value) {
  ObserveRpc("PoolService.SetServerDefault", [&] { ctx_.settings->SetServerDefault(key, value); });
}

} // namespace credpool::service
