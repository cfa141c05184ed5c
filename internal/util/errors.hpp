#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace pipeline::util {

/*
  Central error types.

  Not-found outcomes on job/project lookups are reported as empty
  results, never as exceptions. These types cover everything else.
*/

// Caller supplied a job kind, payload or result that violates its contract.
class ContractViolation : public std::runtime_error {
 public:
  explicit ContractViolation(const std::string& msg) : std::runtime_error(msg) {
  }

  const char* code() const noexcept {
    return "invalid_payload";
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic write lost against a concurrent writer.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockConflict : public std::runtime_error {
 public:
  LockConflict(std::string project_id, std::string owner_agent_id, std::optional<std::string> owner_session_id, std::string expires_at)
      : std::runtime_error("Project lock conflict for " + project_id + ". Locked by " + owner_agent_id + "."),
        project_id_(std::move(project_id)),
        owner_agent_id_(std::move(owner_agent_id)),
        owner_session_id_(std::move(owner_session_id)),
        expires_at_(std::move(expires_at)) {
  }

  const std::string& project_id() const {
    return project_id_;
  }
  const std::string& owner_agent_id() const {
    return owner_agent_id_;
  }
  const std::optional<std::string>& owner_session_id() const {
    return owner_session_id_;
  }
  const std::string& expires_at() const {
    return expires_at_;
  }

 private:
  std::string                project_id_;
  std::string                owner_agent_id_;
  std::optional<std::string> owner_session_id_;
  std::string                expires_at_;
};

} // namespace pipeline::util
