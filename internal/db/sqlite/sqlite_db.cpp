#include "sqlite_db.hpp"

#include <stdexcept>

namespace bridge::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // Payout rows must survive a crash once the call committed.
  Exec("PRAGMA synchronous=FULL;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void BootstrapSchema(SqliteDB& db) {
  static constexpr const char* kSchema[] = {
      "CREATE TABLE IF NOT EXISTS data_requests ("
      "id INTEGER PRIMARY KEY, payload_ref TEXT NOT NULL, payload_hash BLOB NOT NULL, "
      "inclusion_reward INTEGER NOT NULL, tally_reward INTEGER NOT NULL, block_reward INTEGER NOT NULL, "
      "gas_price INTEGER NOT NULL, epoch INTEGER NOT NULL, inclusion_proof_hash BLOB NOT NULL, result BLOB, "
      "claimant BLOB NOT NULL, claim_block INTEGER NOT NULL, requestor BLOB NOT NULL, "
      "deposited INTEGER NOT NULL, paid_out INTEGER NOT NULL, created_block INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS paid_blocks ("
      "block_hash BLOB PRIMARY KEY, first_request INTEGER NOT NULL, relayer BLOB NOT NULL, epoch INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS balances (address BLOB PRIMARY KEY, amount INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS events ("
      "offset INTEGER PRIMARY KEY, kind INTEGER NOT NULL, request_id INTEGER NOT NULL, address BLOB NOT NULL, "
      "amount INTEGER NOT NULL, payout INTEGER NOT NULL, block INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS board_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto* sql : kSchema) {
    db.Exec(sql);
  }

  // Fails loudly against a file created by an incompatible layout.
  db.Exec("SELECT id,payload_ref,payload_hash,inclusion_reward,tally_reward,block_reward,gas_price,epoch,"
          "inclusion_proof_hash,result,claimant,claim_block,requestor,deposited,paid_out,created_block FROM data_requests LIMIT 1;");
  db.Exec("SELECT block_hash,first_request,relayer,epoch FROM paid_blocks LIMIT 1;");
  db.Exec("SELECT address,amount FROM balances LIMIT 1;");
  db.Exec("SELECT offset,kind,request_id,address,amount,payout,block FROM events LIMIT 1;");
  db.Exec("INSERT OR IGNORE INTO board_schema_migrations(version,applied_at_ms) VALUES(1, unixepoch()*1000);");
}

} // namespace bridge::db::sqlite
