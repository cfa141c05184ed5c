#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "pipeline/store/v1.hpp"

namespace pipeline::contracts {

namespace v1 = pipeline::store::v1;

inline constexpr int32_t kDefaultMaxAttempts = 3;
inline constexpr int32_t kMinMaxAttempts     = 1;
inline constexpr int32_t kMaxMaxAttempts     = 10;

inline constexpr int64_t kDefaultLeaseMs = 30000;
inline constexpr int64_t kMinLeaseMs     = 5000;
inline constexpr int64_t kMaxLeaseMs     = 300000;

/*
  Job contracts.

  Kind, payload and result arrive from callers as loosely typed JSON
  values. Everything here either returns the typed form or throws
  util::ContractViolation naming the offending field; nothing mutates
  store state.
*/

// "gltf.convert" / "texture.preflight"; empty for unspecified.
std::string_view KindName(v1::JobKind kind);

// Parses a trimmed kind name; nullopt if it is not one of the supported kinds.
std::optional<v1::JobKind> ParseKind(std::string_view name);

// Trimmed project id; throws "projectId is required" when blank.
std::string NormalizeProjectId(const std::string& project_id);

// Throws "kind is required" / "kind must be one of: ..." on bad input.
v1::JobKind NormalizeJobKind(const std::optional<std::string>& kind);

// Validates `payload` for `kind` and stores the normalized form on `job`.
// nullptr means no payload was supplied.
void ApplyJobPayload(v1::JobKind kind, const google::protobuf::Value* payload, v1::Job* job);

// nullopt when `result` is nullptr; throws on shape violations.
std::optional<v1::JobResult> NormalizeJobResult(v1::JobKind kind, const google::protobuf::Value* result);

// Non-finite or absent values take the fallback; finite values are
// truncated toward zero, then clamped into [min, max].
int64_t ClampInteger(std::optional<double> value, int64_t min, int64_t max, int64_t fallback);

} // namespace pipeline::contracts
