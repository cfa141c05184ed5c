#include "proto_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace pipeline::util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize " + message.GetTypeName() + " to JSON: " + std::string(status.message()));
  }
  return json;
}

std::optional<google::protobuf::Value> ParseJsonValue(const std::string& json) {
  google::protobuf::Value value;
  if (!google::protobuf::util::JsonStringToMessage(json, &value).ok()) {
    return std::nullopt;
  }
  return value;
}

bool ParseJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(json, message, options).ok();
}

bool ValueToMessage(const google::protobuf::Value& value, google::protobuf::Message* message) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(value, &json).ok()) {
    return false;
  }
  return ParseJson(json, message);
}

} // namespace pipeline::util
