#pragma once

#include <string_view>

#include "fleet/coordinator/core/v1/types.pb.h"

namespace fleet::model {

/*
  The two lifecycles of the coordinator, each with one transition table.

  Adoption:
      PENDING  -> APPROVED | REJECTED      (exactly once, administrator)
      APPROVED -> REVOKED                  (administrator)
      REJECTED, REVOKED                    terminal

  Action:
      PENDING   -> DELIVERED | EXPIRED
      DELIVERED -> COMPLETED | FAILED | EXPIRED
      COMPLETED, FAILED, EXPIRED           terminal

  Self-transitions are not legal; a repeated decision is an error.
*/

using AdoptionState    = fleet::coordinator::core::v1::AdoptionState;
using AdoptionDecision = fleet::coordinator::core::v1::AdoptionDecision;
using ActionStatus     = fleet::coordinator::core::v1::ActionStatus;

namespace v1 = fleet::coordinator::core::v1;

constexpr bool IsTerminal(AdoptionState state) {
  return state == v1::ADOPTION_STATE_REJECTED || state == v1::ADOPTION_STATE_REVOKED;
}

constexpr bool CanTransition(AdoptionState from, AdoptionState to) {
  switch (from) {
    case v1::ADOPTION_STATE_PENDING:
      return to == v1::ADOPTION_STATE_APPROVED || to == v1::ADOPTION_STATE_REJECTED;
    case v1::ADOPTION_STATE_APPROVED:
      return to == v1::ADOPTION_STATE_REVOKED;
    default:
      return false;
  }
}

constexpr bool IsTerminal(ActionStatus status) {
  return status == v1::ACTION_STATUS_COMPLETED || status == v1::ACTION_STATUS_FAILED || status == v1::ACTION_STATUS_EXPIRED;
}

constexpr bool CanTransition(ActionStatus from, ActionStatus to) {
  switch (from) {
    case v1::ACTION_STATUS_PENDING:
      return to == v1::ACTION_STATUS_DELIVERED || to == v1::ACTION_STATUS_EXPIRED;
    case v1::ACTION_STATUS_DELIVERED:
      return to == v1::ACTION_STATUS_COMPLETED || to == v1::ACTION_STATUS_FAILED || to == v1::ACTION_STATUS_EXPIRED;
    default:
      return false;
  }
}

constexpr AdoptionState TargetState(AdoptionDecision decision) {
  switch (decision) {
    case v1::ADOPTION_DECISION_APPROVE:
      return v1::ADOPTION_STATE_APPROVED;
    case v1::ADOPTION_DECISION_REJECT:
      return v1::ADOPTION_STATE_REJECTED;
    case v1::ADOPTION_DECISION_REVOKE:
      return v1::ADOPTION_STATE_REVOKED;
    default:
      return v1::ADOPTION_STATE_UNSPECIFIED;
  }
}

// Lowercase names used in audit rows, heartbeat responses and the HTTP gateway.
constexpr std::string_view Name(AdoptionState state) {
  switch (state) {
    case v1::ADOPTION_STATE_PENDING:
      return "pending";
    case v1::ADOPTION_STATE_APPROVED:
      return "approved";
    case v1::ADOPTION_STATE_REJECTED:
      return "rejected";
    case v1::ADOPTION_STATE_REVOKED:
      return "revoked";
    default:
      return "unspecified";
  }
}

constexpr std::string_view Name(ActionStatus status) {
  switch (status) {
    case v1::ACTION_STATUS_PENDING:
      return "pending";
    case v1::ACTION_STATUS_DELIVERED:
      return "delivered";
    case v1::ACTION_STATUS_COMPLETED:
      return "completed";
    case v1::ACTION_STATUS_FAILED:
      return "failed";
    case v1::ACTION_STATUS_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

constexpr AdoptionState ParseAdoptionState(std::string_view name) {
  if (name == "pending") return v1::ADOPTION_STATE_PENDING;
  if (name == "approved") return v1::ADOPTION_STATE_APPROVED;
  if (name == "rejected") return v1::ADOPTION_STATE_REJECTED;
  if (name == "revoked") return v1::ADOPTION_STATE_REVOKED;
  return v1::ADOPTION_STATE_UNSPECIFIED;
}

constexpr ActionStatus ParseActionStatus(std::string_view name) {
  if (name == "pending") return v1::ACTION_STATUS_PENDING;
  if (name == "delivered") return v1::ACTION_STATUS_DELIVERED;
  if (name == "completed") return v1::ACTION_STATUS_COMPLETED;
  if (name == "failed") return v1::ACTION_STATUS_FAILED;
  if (name == "expired") return v1::ACTION_STATUS_EXPIRED;
  return v1::ACTION_STATUS_UNSPECIFIED;
}

// Creation is audited as a transition out of this pseudo-state.
inline constexpr std::string_view kNoState = "none";

} // namespace fleet::model
