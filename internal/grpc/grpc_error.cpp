#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace fleet::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace fleet::util;

  if (dynamic_cast<const Unauthorized*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const UnknownDevice*>(&e) || dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidStateTransition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const StorageFailure*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

std::string MetadataActor(const ::grpc::ServerContext* context) {
  if (context == nullptr) {
    return {};
  }
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find("x-fleet-actor");
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace fleet::grpc
