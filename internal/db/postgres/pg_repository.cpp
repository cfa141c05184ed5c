#include "pg_repository.hpp"

namespace pipeline::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::optional<model::StateDocumentRecord> PgRepository::FindDocument(Transaction& t, const std::string& workspace_id) {
  auto res = TX(t).Work().exec_prepared("find_document", workspace_id);
  if (res.empty()) return std::nullopt;

  model::StateDocumentRecord r;
  r.workspace_id  = res[0][0].c_str();
  r.document      = res[0][1].c_str();
  r.revision      = res[0][2].as<uint64_t>();
  r.updated_at_ms = res[0][3].as<uint64_t>();
  return r;
}

Result PgRepository::SaveDocumentIfRevision(Transaction& t, const model::StateDocumentRecord& r, uint64_t expected_revision) {
  try {
    pqxx::result res;
    if (expected_revision == 0) {
      res = TX(t).Work().exec_prepared("insert_document", r.workspace_id, r.document, r.revision, r.updated_at_ms);
    } else {
      res = TX(t).Work().exec_prepared("update_document", r.workspace_id, r.document, r.revision, r.updated_at_ms, expected_revision);
    }
    if (res.affected_rows() != 1) {
      return Result::Err(ErrorCode::Conflict, "document revision changed: " + r.workspace_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace pipeline::db::postgres
