#pragma once

namespace bridge::db {

/*
  Unit of work against a Repository.

  Every backend provides:
  - writes stay private to the transaction until Commit()
  - Rollback() drops them; destroying an uncommitted transaction rolls back
  - a board call maps to exactly one transaction

  SQLite runs it as BEGIN IMMEDIATE; the memory backend works on a
  snapshot of the committed state.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace bridge::db
