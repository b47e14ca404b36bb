#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace fleet::util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize " + message.GetTypeName() + " to JSON: " + std::string(status.message()));
  }
  return json;
}

void ParseJson(const std::string& json, google::protobuf::Message* message, const std::string& what, bool ignore_unknown_fields) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = ignore_unknown_fields;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw InvalidArgument("invalid " + what + ": " + std::string(status.message()));
  }
}

} // namespace fleet::util
