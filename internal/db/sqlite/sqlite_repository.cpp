#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <array>
#include <cstring>
#include <limits>

namespace bridge::db::sqlite {

using bridge::db::ErrorCode;
using bridge::db::Result;

namespace {

constexpr const char* kRequestColumns =
    "id,payload_ref,payload_hash,inclusion_reward,tally_reward,block_reward,gas_price,epoch,"
    "inclusion_proof_hash,result,claimant,claim_block,requestor,deposited,paid_out,created_block";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBlob(sqlite3_stmt* st, int idx, const uint8_t* data, std::size_t size) {
    sqlite3_bind_blob(st, idx, data, static_cast<int>(size), SQLITE_TRANSIENT);
}

template <std::size_t N>
void BindBlob(sqlite3_stmt* st, int idx, const std::array<uint8_t, N>& v) {
    BindBlob(st, idx, v.data(), v.size());
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

util::Bytes ColBytes(sqlite3_stmt* st, int col) {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(st, col));
    const int   size = sqlite3_column_bytes(st, col);
    if (!data || size <= 0) return {};
    return util::Bytes(data, data + size);
}

template <std::size_t N>
std::array<uint8_t, N> ColFixed(sqlite3_stmt* st, int col) {
    std::array<uint8_t, N> out{};
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(st, col));
    if (data && sqlite3_column_bytes(st, col) == static_cast<int>(N)) {
        std::memcpy(out.data(), data, N);
    }
    return out;
}

model::RequestRecord ReadRequestRow(sqlite3_stmt* st) {
    model::RequestRecord r;
    r.id                   = ColU64(st, 0);
    r.payload_ref          = ColText(st, 1);
    r.payload_hash         = ColFixed<32>(st, 2);
    r.inclusion_reward     = ColU64(st, 3);
    r.tally_reward         = ColU64(st, 4);
    r.block_reward         = ColU64(st, 5);
    r.gas_price            = ColU64(st, 6);
    r.epoch                = ColU64(st, 7);
    r.inclusion_proof_hash = ColFixed<32>(st, 8);
    r.result               = ColBytes(st, 9);
    r.claimant             = ColFixed<20>(st, 10);
    r.claim_block          = ColU64(st, 11);
    r.requestor            = ColFixed<20>(st, 12);
    r.deposited            = ColU64(st, 13);
    r.paid_out             = ColU64(st, 14);
    r.created_block        = ColU64(st, 15);
    return r;
}

// Binds every column except id, starting at idx.
int BindRequestColumns(sqlite3_stmt* st, int idx, const model::RequestRecord& r) {
    BindText(st, idx++, r.payload_ref);
    BindBlob(st, idx++, r.payload_hash);
    BindU64(st, idx++, r.inclusion_reward);
    BindU64(st, idx++, r.tally_reward);
    BindU64(st, idx++, r.block_reward);
    BindU64(st, idx++, r.gas_price);
    BindU64(st, idx++, r.epoch);
    BindBlob(st, idx++, r.inclusion_proof_hash);
    if (r.result.empty()) {
        sqlite3_bind_null(st, idx++);
    } else {
        BindBlob(st, idx++, r.result.data(), r.result.size());
    }
    BindBlob(st, idx++, r.claimant);
    BindU64(st, idx++, r.claim_block);
    BindBlob(st, idx++, r.requestor);
    BindU64(st, idx++, r.deposited);
    BindU64(st, idx++, r.paid_out);
    BindU64(st, idx++, r.created_block);
    return idx;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Data requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertRequest(Transaction& t, model::RequestRecord& r) {
    auto* db = TX(t).Handle();

    // Ids are dense: the next id is one past the current maximum.
    sqlite3_stmt* max_st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COALESCE(MAX(id), 0) FROM data_requests;", -1, &max_st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    uint64_t next_id = 1;
    if (sqlite3_step(max_st) == SQLITE_ROW) {
        next_id = ColU64(max_st, 0) + 1;
    }
    sqlite3_finalize(max_st);

    const std::string sql = std::string("INSERT INTO data_requests(") + kRequestColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, next_id);
    BindRequestColumns(st, 2, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result) r.id = next_id;
    return result;
}

std::optional<model::RequestRecord>
SqliteRepository::GetRequest(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kRequestColumns + " FROM data_requests WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindU64(st, 1, id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadRequestRow(st);
    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE data_requests SET payload_ref=?,payload_hash=?,inclusion_reward=?,tally_reward=?,block_reward=?,"
        "gas_price=?,epoch=?,inclusion_proof_hash=?,result=?,claimant=?,claim_block=?,requestor=?,"
        "deposited=?,paid_out=?,created_block=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const int next = BindRequestColumns(st, 1, r);
    BindU64(st, next, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "request not found");
    return Translate(db, rc);
}

uint64_t SqliteRepository::CountRequests(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM data_requests;", -1, &st, nullptr) != SQLITE_OK)
        return 0;

    uint64_t count = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
        count = ColU64(st, 0);
    }
    sqlite3_finalize(st);
    return count;
}

std::vector<model::RequestRecord> SqliteRepository::ListRequests(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kRequestColumns + " FROM data_requests ORDER BY id ASC;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    std::vector<model::RequestRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadRequestRow(st));
    }
    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Paid-block set
// ------------------------------------------------------------------

std::optional<model::PaidBlockRecord>
SqliteRepository::GetPaidBlock(Transaction& t, const util::Hash256& block_hash) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT block_hash,first_request,relayer,epoch FROM paid_blocks WHERE block_hash=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindBlob(st, 1, block_hash);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::PaidBlockRecord r;
    r.block_hash    = ColFixed<32>(st, 0);
    r.first_request = ColU64(st, 1);
    r.relayer       = ColFixed<20>(st, 2);
    r.epoch         = ColU64(st, 3);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::InsertPaidBlock(Transaction& t, const model::PaidBlockRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql = "INSERT INTO paid_blocks(block_hash,first_request,relayer,epoch) VALUES(?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, r.block_hash);
    BindU64(st, 2, r.first_request);
    BindBlob(st, 3, r.relayer);
    BindU64(st, 4, r.epoch);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "block already paid");
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

Result SqliteRepository::CreditBalance(Transaction& t, const util::Address& address, util::Amount amount) {
    const auto current = GetBalance(t, address);
    if (current > std::numeric_limits<util::Amount>::max() - amount)
        return Result::Err(ErrorCode::ConstraintViolation, "balance overflow");

    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO balances(address,amount) VALUES(?,?) "
        "ON CONFLICT(address) DO UPDATE SET amount=excluded.amount;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, address);
    BindU64(st, 2, current + amount);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

util::Amount SqliteRepository::GetBalance(Transaction& t, const util::Address& address) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT amount FROM balances WHERE address=?;", -1, &st, nullptr) != SQLITE_OK)
        return 0;

    BindBlob(st, 1, address);

    util::Amount amount = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
        amount = ColU64(st, 0);
    }
    sqlite3_finalize(st);
    return amount;
}

std::vector<model::BalanceRecord> SqliteRepository::ListBalances(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT address,amount FROM balances ORDER BY address ASC;", -1, &st, nullptr) != SQLITE_OK)
        return {};

    std::vector<model::BalanceRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back({ColFixed<20>(st, 0), ColU64(st, 1)});
    }
    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvents(Transaction& t, std::vector<model::EventRecord>& events) {
    auto* db = TX(t).Handle();

    const char* max_sql = "SELECT COALESCE(MAX(offset), -1) FROM events;";
    sqlite3_stmt* max_st = nullptr;
    if (sqlite3_prepare_v2(db, max_sql, -1, &max_st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    uint64_t next_offset = 0;
    if (sqlite3_step(max_st) == SQLITE_ROW) {
        next_offset = static_cast<uint64_t>(sqlite3_column_int64(max_st, 0) + 1);
    }
    sqlite3_finalize(max_st);

    const char* ins_sql =
        "INSERT INTO events(offset,kind,request_id,address,amount,payout,block) VALUES(?,?,?,?,?,?,?);";

    sqlite3_stmt* ins_st = nullptr;
    if (sqlite3_prepare_v2(db, ins_sql, -1, &ins_st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (auto& e : events) {
        e.offset = next_offset++;

        sqlite3_reset(ins_st);
        sqlite3_clear_bindings(ins_st);

        BindU64(ins_st, 1, e.offset);
        sqlite3_bind_int(ins_st, 2, static_cast<int>(e.kind));
        BindU64(ins_st, 3, e.request_id);
        BindBlob(ins_st, 4, e.address);
        BindU64(ins_st, 5, e.amount);
        sqlite3_bind_int(ins_st, 6, static_cast<int>(e.payout));
        BindU64(ins_st, 7, e.block);

        int rc = sqlite3_step(ins_st);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(ins_st);
            return Translate(db, rc);
        }
    }

    sqlite3_finalize(ins_st);
    return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(
    Transaction& t, uint64_t start_offset, std::optional<uint64_t> max_events) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT offset,kind,request_id,address,amount,payout,block FROM events WHERE offset>=? ORDER BY offset ASC";
    if (max_events.has_value()) {
        sql += " LIMIT ?";
    }
    sql += ";";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return {};

    BindU64(st, 1, start_offset);
    if (max_events.has_value()) {
        BindU64(st, 2, *max_events);
    }

    std::vector<model::EventRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        model::EventRecord e;
        e.offset     = ColU64(st, 0);
        e.kind       = static_cast<bridge::v1::EventKind>(sqlite3_column_int(st, 1));
        e.request_id = ColU64(st, 2);
        e.address    = ColFixed<20>(st, 3);
        e.amount     = ColU64(st, 4);
        e.payout     = static_cast<bridge::v1::PayoutKind>(sqlite3_column_int(st, 5));
        e.block      = ColU64(st, 6);
        out.push_back(e);
    }

    sqlite3_finalize(st);
    return out;
}

}
