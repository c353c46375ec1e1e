#include "ledger.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace bridge::core {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::ValidationError(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::StateError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

Ledger::Ledger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

// ------------------------------------------------------------------
// Call scope
// ------------------------------------------------------------------

Ledger::Scope::Scope(Ledger& ledger) : ledger_(ledger), lock_(ledger.mutex_) {
  outermost_ = ledger_.depth_ == 0;
  if (outermost_) {
    ledger_.tx_       = ledger_.repository_->Begin();
    ledger_.poisoned_ = false;
  }
  ++ledger_.depth_;
}

Ledger::Scope::~Scope() {
  --ledger_.depth_;
  ledger_.Finish(outermost_, committed_);
}

void Ledger::Scope::Commit() {
  if (!outermost_) {
    committed_ = true;
    return;
  }
  if (ledger_.poisoned_) {
    throw util::StateError("nested board call failed");
  }

  ledger_.tx_->Commit();
  committed_ = true;
}

void Ledger::Finish(bool outermost, bool committed) {
  if (!outermost) {
    if (!committed) poisoned_ = true;
    return;
  }

  auto hooks = std::move(after_commit_);
  after_commit_.clear();
  poisoned_ = false;

  if (!committed) {
    try {
      tx_->Rollback();
    } catch (const std::exception& e) {
      BRIDGE_LOG_ERROR("ledger rollback failed", {observability::StringField("error", e.what())});
    }
    tx_.reset();
    return;
  }

  tx_.reset();
  for (auto& hook : hooks) {
    try {
      hook();
    } catch (const std::exception& e) {
      BRIDGE_LOG_WARN("post-commit hook failed", {observability::StringField("error", e.what())});
    }
  }
}

db::Transaction& Ledger::Tx() {
  if (!tx_) {
    throw std::logic_error("ledger accessed outside of a call scope");
  }
  return *tx_;
}

void Ledger::AfterCommit(std::function<void()> hook) {
  after_commit_.push_back(std::move(hook));
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

db::model::RequestRecord Ledger::Load(uint64_t id) {
  auto record = repository_->GetRequest(Tx(), id);
  if (!record.has_value()) {
    throw util::ValidationError("bad handle");
  }
  return *record;
}

uint64_t Ledger::Insert(db::model::RequestRecord& record) {
  ThrowIfDbError(repository_->InsertRequest(Tx(), record), "insert request");
  return record.id;
}

void Ledger::Store(const db::model::RequestRecord& record) {
  ThrowIfDbError(repository_->UpdateRequest(Tx(), record), "update request");
}

uint64_t Ledger::Count() {
  return repository_->CountRequests(Tx());
}

std::vector<db::model::RequestRecord> Ledger::All() {
  return repository_->ListRequests(Tx());
}

// ------------------------------------------------------------------
// Paid blocks, balances, events
// ------------------------------------------------------------------

std::optional<db::model::PaidBlockRecord> Ledger::PaidBlock(const util::Hash256& block_hash) {
  return repository_->GetPaidBlock(Tx(), block_hash);
}

void Ledger::MarkPaid(const db::model::PaidBlockRecord& record) {
  ThrowIfDbError(repository_->InsertPaidBlock(Tx(), record), "mark block paid");
}

void Ledger::Credit(const util::Address& beneficiary, util::Amount amount, uint64_t request_id, bridge::v1::PayoutKind kind,
                    uint64_t block_number) {
  if (amount == 0) {
    return;
  }
  ThrowIfDbError(repository_->CreditBalance(Tx(), beneficiary, amount), "credit balance");

  db::model::EventRecord event;
  event.kind       = bridge::v1::EVENT_KIND_PAYOUT;
  event.request_id = request_id;
  event.address    = beneficiary;
  event.amount     = amount;
  event.payout     = kind;
  event.block      = block_number;
  Emit(event);

  AfterCommit([kind, amount] { observability::Metrics::Instance().RecordPayout(bridge::v1::PayoutKind_Name(kind), amount); });
}

util::Amount Ledger::Balance(const util::Address& address) {
  return repository_->GetBalance(Tx(), address);
}

std::vector<db::model::BalanceRecord> Ledger::Balances() {
  return repository_->ListBalances(Tx());
}

void Ledger::Emit(db::model::EventRecord event) {
  std::vector<db::model::EventRecord> events{event};
  ThrowIfDbError(repository_->AppendEvents(Tx(), events), "append event");
}

std::vector<db::model::EventRecord> Ledger::Events(uint64_t from_offset, std::optional<uint64_t> max_events) {
  return repository_->ReadEvents(Tx(), from_offset, max_events);
}

} // namespace bridge::core
