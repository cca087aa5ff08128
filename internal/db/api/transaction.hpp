#pragma once

#include <utility>

#include "result.hpp"

namespace powerscore::db {

/*
  One unit of work against the ranking store.

  The batch writer opens one per chunk of rankings, snapshots or
  residuals; the result cache and the snapshot pruner open one per
  read-modify-write. Every backend guarantees:

  - rows upserted in an open transaction are invisible to others
  - Commit() publishes the whole chunk or throws, publishing nothing
  - Rollback() drops the chunk
  - destroying an unfinished transaction rolls it back

  SQLite takes the write lock up front (BEGIN IMMEDIATE), Postgres runs
  a pqxx::work, and the in-memory store checks its snapshot version at
  commit.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsFinished() const = 0;

  // Commits when `work` succeeded, otherwise rolls back. Returns `work`.
  Result Finish(Result work) {
    if (work) {
      Commit();
    } else {
      Rollback();
    }
    return work;
  }
};

} // namespace powerscore::db
