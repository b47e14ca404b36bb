#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace fleet::util {

/*
  protobuf <-> JSON with proto field names preserved.

  Used for stored blobs (system_info, action spec/result) and for the HTTP
  gateway bodies.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws InvalidArgument naming `what` when json does not parse into message.
void ParseJson(const std::string& json, google::protobuf::Message* message, const std::string& what, bool ignore_unknown_fields = false);

} // namespace fleet::util
