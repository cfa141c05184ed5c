#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace pipeline::model {

/*
  Operation inputs as they arrive from callers. Numbers that get
  clamped stay doubles so out-of-range and non-finite values reach the
  clamping rules untouched.
*/

struct SubmitJobInput {
  std::string                            project_id;
  std::optional<std::string>             kind;
  std::optional<google::protobuf::Value> payload;
  std::optional<double>                  max_attempts;
  std::optional<double>                  lease_ms;
};

struct CreateFolderInput {
  std::string                name;
  std::optional<std::string> parent_folder_id;
  std::optional<int64_t>     index;
};

struct MoveFolderInput {
  std::string                folder_id;
  std::optional<std::string> parent_folder_id;
  std::optional<int64_t>     index;
};

struct CreateProjectInput {
  std::string                name;
  std::optional<std::string> parent_folder_id;
  std::optional<int64_t>     index;
};

struct MoveProjectInput {
  std::string                project_id;
  std::optional<std::string> parent_folder_id;
  std::optional<int64_t>     index;
};

struct AcquireLockInput {
  std::string                project_id;
  std::string                owner_agent_id;
  std::optional<std::string> owner_session_id;
  std::optional<double>      ttl_ms;
};

using RenewLockInput = AcquireLockInput;

struct ReleaseLockInput {
  std::string                project_id;
  std::string                owner_agent_id;
  std::optional<std::string> owner_session_id;
};

} // namespace pipeline::model
