#include "http_error.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::http {

namespace {

HttpError Make(int status, std::string kind, const std::exception& e) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["error"].set_string_value(kind);
  (*body.mutable_fields())["message"].set_string_value(e.what());

  HttpError error;
  error.status = status;
  error.kind   = std::move(kind);
  error.body   = util::ToJson(body);
  return error;
}

} // namespace

HttpError ToHttpError(const std::exception& e) {
  using namespace fleet::util;

  if (dynamic_cast<const Unauthorized*>(&e)) {
    return Make(403, "unauthorized", e);
  }
  if (dynamic_cast<const UnknownDevice*>(&e)) {
    return Make(404, "unknown_device", e);
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return Make(404, "not_found", e);
  }
  if (dynamic_cast<const InvalidStateTransition*>(&e)) {
    return Make(409, "invalid_state_transition", e);
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return Make(400, "invalid_argument", e);
  }
  if (dynamic_cast<const StorageFailure*>(&e)) {
    return Make(503, "storage_failure", e);
  }
  return Make(500, "internal", e);
}

} // namespace fleet::http
