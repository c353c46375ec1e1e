#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "support/board_harness.hpp"

#if BRIDGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using bridge::testing::Addr;
using bridge::testing::BoardHarness;
using bridge::testing::Hash;
using bridge::testing::Throws;

using RepositoryFactory = std::function<std::shared_ptr<bridge::db::Repository>()>;

// Same board script on any backend; the observable state must match.
void RunLifecycle(const std::string& backend, const RepositoryFactory& make) {
  BoardHarness h(make());

  const auto first  = h.PostDefault(Addr(1), "GET /a");
  const auto second = h.PostDefault(Addr(2), "GET /b");
  assert(first == 1 && second == 2);
  assert(h.board->RequestCount() == 2);

  h.Claim(0x07, {first, second});
  const auto block = h.RelayBlock(Addr(9), first, "42", 0x30);

  auto bad  = BoardHarness::Inclusion(first, block);
  bad.proof = {Hash(0xEE)};
  assert(Throws<bridge::util::ProofError>([&] { h.board->ReportInclusion(h.Ctx(Addr(7)), bad); }));
  assert(bridge::util::IsZero(h.board->ReadProofHash(first)));

  h.board->ReportInclusion(h.Ctx(Addr(7)), BoardHarness::Inclusion(first, block));
  h.board->ReportResult(h.Ctx(Addr(7)), BoardHarness::Result(first, block, "42"));

  assert(h.board->IsResolved(first));
  assert(bridge::util::ToString(h.board->ReadResult(first)) == "42");
  assert(h.board->ReadBalance(Addr(7)) == 6'000'000);
  assert(h.board->ReadBalance(Addr(9)) == 4'000'000);
  assert(h.Outstanding(first) == 0);
  assert(h.Outstanding(second) == 10'000'000);

  const auto rewards = h.board->UpgradeReward(h.Ctx(Addr(2), 500), second, 200, 300);
  assert(rewards.inclusion == 3'000'200 && rewards.tally == 3'000'300);

  const auto events = h.board->ReadEvents(0, std::nullopt);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].offset == i);
  }
  assert(events.front().kind == bridge::v1::EVENT_KIND_POSTED_REQUEST);
  assert(events.back().kind == bridge::v1::EVENT_KIND_UPGRADED_REWARD);
  assert(h.board->ReadEvents(2, 3).size() == 3);

  // An oversized page returns the tail on every backend.
  constexpr auto kUnbounded = std::numeric_limits<uint64_t>::max();
  assert(h.board->ReadEvents(2, kUnbounded).size() == events.size() - 2);
  assert(h.board->ReadEvents(events.size() - 1, kUnbounded).size() == 1);
  assert(h.board->ReadEvents(events.size(), kUnbounded).empty());

  const auto stats = h.board->Stats(h.clock->Current());
  assert(stats.requests_total() == 2);
  assert(stats.requests_resulted() == 1);
  assert(stats.requests_claimed() == 1);

  std::cout << "  " << backend << ": " << events.size() << " events\n";
}

// Uncommitted events read back in order and vanish on rollback.
void RunEventLog(const std::string& backend, const RepositoryFactory& make) {
  auto repository = make();

  auto Append = [&](bridge::db::Transaction& tx, uint64_t request_id) {
    std::vector<bridge::db::model::EventRecord> events(1);
    events[0].kind       = bridge::v1::EVENT_KIND_POSTED_REQUEST;
    events[0].request_id = request_id;
    const auto appended = repository->AppendEvents(tx, events);
    assert(appended);
    return events[0].offset;
  };

  {
    auto tx = repository->Begin();
    assert(Append(*tx, 1) == 0);
    assert(Append(*tx, 2) == 1);
    tx->Commit();
  }
  {
    auto tx = repository->Begin();
    assert(Append(*tx, 3) == 2);
    const auto span = repository->ReadEvents(*tx, 1, std::nullopt);
    assert(span.size() == 2);
    assert(span[0].offset == 1 && span[0].request_id == 2);
    assert(span[1].offset == 2 && span[1].request_id == 3);
    tx->Rollback();
  }
  {
    auto tx = repository->Begin();
    assert(repository->ReadEvents(*tx, 0, std::nullopt).size() == 2);
    assert(Append(*tx, 4) == 2);
    assert(repository->ReadEvents(*tx, 0, 2).back().request_id == 2);
    assert(repository->ReadEvents(*tx, 2, std::numeric_limits<uint64_t>::max()).front().request_id == 4);
    tx->Commit();
  }

  auto tx     = repository->Begin();
  auto events = repository->ReadEvents(*tx, 0, std::nullopt);
  assert(events.size() == 3);
  assert(events[2].request_id == 4);
  tx->Rollback();

  std::cout << "  " << backend << ": event log\n";
}

#if BRIDGE_DB_SQLITE
std::filesystem::path TempDatabase() {
  auto path = std::filesystem::temp_directory_path() / "bridge_repository_parity.db";
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path;
}

std::shared_ptr<bridge::db::Repository> OpenSqlite(const std::filesystem::path& path) {
  auto db = std::make_shared<bridge::db::sqlite::SqliteDB>(path.string(), true);
  bridge::db::sqlite::BootstrapSchema(*db);
  return std::make_shared<bridge::db::sqlite::SqliteRepository>(std::move(db));
}

void TestSqliteStateSurvivesReopen(const std::filesystem::path& path) {
  auto repository = OpenSqlite(path);
  auto tx         = repository->Begin();

  assert(repository->CountRequests(*tx) == 2);
  const auto first = repository->GetRequest(*tx, 1);
  assert(first.has_value());
  assert(bridge::util::ToString(first->result) == "42");
  assert(first->paid_out == first->deposited);
  assert(repository->GetPaidBlock(*tx, Hash(0x30)).has_value());
  assert(repository->GetPaidBlock(*tx, Hash(0x30))->first_request == 1);
  assert(repository->GetBalance(*tx, Addr(7)) == 6'000'000);
  assert(!repository->GetRequest(*tx, 3).has_value());
  tx->Rollback();
}
#endif

} // namespace

int main() {
  RunLifecycle("memory", [] { return std::make_shared<bridge::db::memory::MemoryRepository>(); });
  RunEventLog("memory", [] { return std::make_shared<bridge::db::memory::MemoryRepository>(); });

#if BRIDGE_DB_SQLITE
  const auto path = TempDatabase();
  RunLifecycle("sqlite", [&] { return OpenSqlite(path); });
  TestSqliteStateSurvivesReopen(path);
  std::filesystem::remove(path);

  const auto log_path = TempDatabase();
  RunEventLog("sqlite", [&] { return OpenSqlite(log_path); });
  std::filesystem::remove(log_path);
#endif

  std::cout << "bridge_integration_repository_parity: pass\n";
  return 0;
}
