#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace credpool::core {

/*
  Translates a failed db::Result into the util exception hierarchy.
  Contention (Busy, Conflict, SerializationFailure) becomes
  util::Unavailable so RunWithRetry can take another attempt.
*/
inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.IsTransient()) {
    throw util::Unavailable(message);
  }
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::InvalidArgument:
      throw util::InvalidArgument(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

/*
  Runs fn (one complete unit of work) up to max_attempts times while it
  fails with storage contention. Each attempt must open its own
  transaction. Gives up with util::Unavailable.
*/
template <typename Fn>
auto RunWithRetry(uint32_t max_attempts, std::string_view operation, Fn&& fn) -> decltype(fn()) {
  const uint32_t attempts = max_attempts == 0 ? 1 : max_attempts;
  for (uint32_t attempt = 1;; ++attempt) {
    std::string error;
    try {
      return fn();
    } catch (const util::Unavailable& e) {
      error = e.what();
    } catch (const db::TransactionConflict& e) {
      error = e.what();
    }

    if (attempt >= attempts) {
      throw util::Unavailable(std::string(operation) + ": storage busy after " + std::to_string(attempts) +
                              " attempts: " + error);
    }
    CREDPOOL_LOG_WARN("Retrying after storage contention", {observability::StringField("operation", operation),
                                                            observability::IntField("attempt", attempt),
                                                            observability::StringField("error", error)});
  }
}

} // namespace credpool::core
