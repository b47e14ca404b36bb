#pragma once

#include <exception>
#include <string>

#include <grpcpp/grpcpp.h>

namespace fleet::grpc {

/*
  Converts domain exceptions into gRPC status codes.

    Unauthorized             -> PERMISSION_DENIED
    UnknownDevice, NotFound  -> NOT_FOUND
    InvalidStateTransition   -> FAILED_PRECONDITION
    InvalidArgument          -> INVALID_ARGUMENT
    StorageFailure           -> UNAVAILABLE
    anything else            -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

// Administrator named by the `x-fleet-actor` metadata header, or empty.
std::string MetadataActor(const ::grpc::ServerContext* context);

} // namespace fleet::grpc
