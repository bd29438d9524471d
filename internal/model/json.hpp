#pragma once

#include <google/protobuf/message.h>

#include <string>
#include <string_view>

namespace chatrelay::model {

/*
  Protobuf JSON mapping with proto field names, used for every wire and
  on-disk record. Compact output is a single line.
*/
std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Also prints fields holding their default value (false, 0, "").
std::string ToJsonWithDefaults(const google::protobuf::Message& message);

// Throws util::ValidationError when `json` does not parse into `out`.
void FromJson(std::string_view json, google::protobuf::Message* out, bool ignore_unknown_fields = true);

} // namespace chatrelay::model
