#include <cassert>
#include <iostream>

#if PIPELINE_DB_SQLITE

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using pipeline::db::sqlite::SqliteDB;
using pipeline::db::sqlite::SqliteRepository;

constexpr const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS pipeline_state_document (workspace_id TEXT PRIMARY KEY, document TEXT NOT NULL, revision "
    "INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);";

struct TempDatabase {
  std::string path;

  TempDatabase() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    path = (std::filesystem::temp_directory_path() / ("pipeline_sqlite_repo_" + std::to_string(ms) + ".db")).string();
  }

  ~TempDatabase() {
    std::error_code ec;
    for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(path + suffix, ec);
  }
};

void TestReadFailureIsNotAMissingRow() {
  TempDatabase tmp;
  auto         db = std::make_shared<SqliteDB>(tmp.path);
  SqliteRepository repo(db);

  // no schema yet: the lookup fails instead of reporting "no document"
  bool threw = false;
  {
    auto tx = repo.Begin();
    try {
      repo.FindDocument(*tx, "ws_a");
    } catch (const pipeline::util::Conflict&) {
      assert(false && "schema error is not lock contention");
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("find pipeline state") == 0;
    }
  }
  assert(threw);

  db->Exec(kCreateTable);
  auto tx = repo.Begin();
  assert(!repo.FindDocument(*tx, "ws_a").has_value());

  pipeline::db::model::StateDocumentRecord record;
  record.workspace_id  = "ws_a";
  record.document      = "{}";
  record.revision      = 1;
  record.updated_at_ms = 1700000000000;
  const auto saved     = repo.SaveDocumentIfRevision(*tx, record, 0);
  assert(saved);

  auto found = repo.FindDocument(*tx, "ws_a");
  assert(found.has_value());
  assert(found->revision == 1);
  assert(found->updated_at_ms == 1700000000000);
  tx->Commit();
}

} // namespace

int main() {
  TestReadFailureIsNotAMissingRow();

  std::cout << "sqlite_repository_test: pass\n";
  return 0;
}

#else

int main() {
  std::cout << "sqlite_repository_test: skipped (built without sqlite)\n";
  return 0;
}

#endif
