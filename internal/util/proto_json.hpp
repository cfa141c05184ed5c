#pragma once

#include <optional>
#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace pipeline::util {

/*
  JSON helpers over protobuf's json_util. Field names use lowerCamelCase
  so the documents match the external JSON contracts.
*/

// Throws std::runtime_error when the message cannot be printed.
std::string ToJson(const google::protobuf::Message& message);

// Parses arbitrary JSON text into a Value; nullopt on malformed input.
std::optional<google::protobuf::Value> ParseJsonValue(const std::string& json);

// Parses JSON text into `message`, ignoring unknown fields.
bool ParseJson(const std::string& json, google::protobuf::Message* message);

// Re-parses a Value into a typed message, ignoring unknown fields.
bool ValueToMessage(const google::protobuf::Value& value, google::protobuf::Message* message);

} // namespace pipeline::util
