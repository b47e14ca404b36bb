#pragma once

#include <string_view>

#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::model {

/*
  Stable text forms of audit subjects and actors, as stored in audit_log and
  accepted by the HTTP gateway query string.
*/

constexpr std::string_view Name(fleet::coordinator::core::v1::SubjectType type) {
  switch (type) {
    case fleet::coordinator::core::v1::SUBJECT_TYPE_DEVICE:
      return "device";
    case fleet::coordinator::core::v1::SUBJECT_TYPE_ACTION:
      return "action";
    default:
      return "unspecified";
  }
}

constexpr std::string_view Name(fleet::coordinator::core::v1::ActorType type) {
  switch (type) {
    case fleet::coordinator::core::v1::ACTOR_TYPE_DEVICE:
      return "device";
    case fleet::coordinator::core::v1::ACTOR_TYPE_REAPER:
      return "reaper";
    case fleet::coordinator::core::v1::ACTOR_TYPE_ADMINISTRATOR:
      return "administrator";
    default:
      return "unspecified";
  }
}

constexpr fleet::coordinator::core::v1::SubjectType ParseSubjectType(std::string_view name) {
  if (name == "device") return fleet::coordinator::core::v1::SUBJECT_TYPE_DEVICE;
  if (name == "action") return fleet::coordinator::core::v1::SUBJECT_TYPE_ACTION;
  return fleet::coordinator::core::v1::SUBJECT_TYPE_UNSPECIFIED;
}

constexpr fleet::coordinator::core::v1::ActorType ParseActorType(std::string_view name) {
  if (name == "device") return fleet::coordinator::core::v1::ACTOR_TYPE_DEVICE;
  if (name == "reaper") return fleet::coordinator::core::v1::ACTOR_TYPE_REAPER;
  if (name == "administrator") return fleet::coordinator::core::v1::ACTOR_TYPE_ADMINISTRATOR;
  return fleet::coordinator::core::v1::ACTOR_TYPE_UNSPECIFIED;
}

} // namespace fleet::model
