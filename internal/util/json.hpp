#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace docsync::util {

/*
  Single-line JSON rendering of a protobuf message.

  Field names stay in snake_case and zero-valued scalars are printed, so every
  document and stats object carries the same keys. Throws std::runtime_error
  when the message cannot be rendered.
*/
std::string ToJson(const google::protobuf::Message& message);

} // namespace docsync::util
