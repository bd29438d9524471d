#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace chatrelay::model {

namespace {

std::string Print(const google::protobuf::Message& message, const google::protobuf::util::JsonPrintOptions& options) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("json serialization failed: " + std::string(status.message()));
  }
  return out;
}

} // namespace

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.add_whitespace             = pretty;
  return Print(message, options);
}

std::string ToJsonWithDefaults(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;
  return Print(message, options);
}

void FromJson(std::string_view json, google::protobuf::Message* out, bool ignore_unknown_fields) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = ignore_unknown_fields;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), out, options);
  if (!status.ok()) {
    throw util::ValidationError("invalid json: " + std::string(status.message()));
  }
}

} // namespace chatrelay::model
