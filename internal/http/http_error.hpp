#pragma once

#include <exception>
#include <string>

namespace fleet::http {

struct HttpError {
  int         status = 500;
  std::string kind;
  // {"error":"<kind>","message":"<text>"}
  std::string body;
};

/*
  Domain exception -> HTTP status, mirroring the gRPC mapping:

    Unauthorized 403, UnknownDevice 404, NotFound 404,
    InvalidStateTransition 409, InvalidArgument 400,
    StorageFailure 503, anything else 500.
*/
HttpError ToHttpError(const std::exception& e);

} // namespace fleet::http
