#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace credpool::model {

/*
  Pool class of a credential.

  Persisted by name, never by ordinal.
*/
enum class AssignmentType : std::uint8_t {
  kUserRequestable    = 1,
  kInstanceAutoAssign = 2,
  kReserved           = 3,
};

constexpr std::string_view ToString(AssignmentType type) {
  switch (type) {
    case AssignmentType::kInstanceAutoAssign:
      return "INSTANCE_AUTO_ASSIGN";
    case AssignmentType::kReserved:
      return "RESERVED";
    case AssignmentType::kUserRequestable:
    default:
      return "USER_REQUESTABLE";
  }
}

constexpr std::optional<AssignmentType> ParseAssignmentType(std::string_view name) {
  if (name == "USER_REQUESTABLE") {
    return AssignmentType::kUserRequestable;
  }
  if (name == "INSTANCE_AUTO_ASSIGN") {
    return AssignmentType::kInstanceAutoAssign;
  }
  if (name == "RESERVED") {
    return AssignmentType::kReserved;
  }
  return std::nullopt;
}

inline constexpr AssignmentType kAllAssignmentTypes[] = {
    AssignmentType::kUserRequestable,
    AssignmentType::kInstanceAutoAssign,
    AssignmentType::kReserved,
};

} // namespace credpool::model
