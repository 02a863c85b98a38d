#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace docsync::util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize to JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace docsync::util
