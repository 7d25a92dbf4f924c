#pragma once

namespace convtree::db {

/*
  Abstract transaction.

  Every tree mutation (create / update / delete / active pointer move)
  runs inside exactly one of these. Semantics for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if neither Commit() nor Rollback() ran

  SQLite: BEGIN IMMEDIATE (single writer, waits up to busy_timeout)
  Postgres: pqxx::work
  Memory: snapshot copy, commit fails on a concurrent modification
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true after a successful Commit()
  virtual bool IsCommitted() const = 0;
};

} // namespace convtree::db
