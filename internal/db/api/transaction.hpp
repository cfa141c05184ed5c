#pragma once

namespace pipeline::db {

/*
  One read-modify-write of a workspace document.

  A store opens a transaction, reads the document row, and either
  rolls back (reads) or saves the next revision and commits (writes).
  Nothing written is visible to other stores before Commit(), and a
  transaction destroyed without Commit() rolls back.

    sqlite    BEGIN IMMEDIATE, so writers serialize on the file lock
    postgres  pqxx::work, row read FOR UPDATE
    memory    copy of the document map, version checked on commit

  Commit() throws util::Conflict when the backend detects a concurrent
  writer at commit time.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace pipeline::db
