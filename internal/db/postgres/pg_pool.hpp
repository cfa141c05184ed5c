#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace pipeline::db::postgres {

/*
  PgPool

  Connections for PgRepository. A store holds one connection per
  document transaction and gives it back when the transaction ends, so
  `max_connections` bounds how many operations one store runs against
  the database at once. Acquire() blocks past that bound.

  Every new connection gets the find/insert/update document statements
  prepared before it is handed out. pqxx::connection is not thread
  safe; a connection is never shared between transactions.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace pipeline::db::postgres
