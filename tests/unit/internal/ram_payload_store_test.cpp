#include <cassert>
#include <iostream>

#include "internal/payload/ram_payload_store.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "support/board_harness.hpp"

namespace {

using bridge::payload::RamPayloadStore;
using bridge::testing::Throws;
using bridge::util::ToBytes;

void TestPutAndRead() {
  RamPayloadStore store;
  const auto      ref = store.Put(ToBytes("GET /price?pair=ETH-USD"));
  assert(!ref.empty());

  const auto buffer = store.Read(ref);
  assert(buffer->ToString() == "GET /price?pair=ETH-USD");
  assert(store.PayloadBytes(ref) == ToBytes("GET /price?pair=ETH-USD"));

  assert(store.Put(ToBytes("x")) != ref);
}

void TestEmptyPayload() {
  RamPayloadStore store;
  const auto      ref = store.Put({});
  assert(store.PayloadBytes(ref).empty());
}

void TestReplaceKeepsEarlierReadersStable() {
  RamPayloadStore store;
  const auto      ref    = store.Put(ToBytes("before"));
  const auto      before = store.Read(ref);

  store.Replace(ref, ToBytes("after"));
  assert(before->ToString() == "before");
  assert(store.Read(ref)->ToString() == "after");
}

void TestUnknownReference() {
  RamPayloadStore store;
  assert(Throws<bridge::util::ValidationError>([&] { store.Read("missing"); }, "unknown payload reference"));
  assert(Throws<bridge::util::ValidationError>([&] { store.Replace("missing", ToBytes("x")); }));

  const auto ref = store.Put(ToBytes("x"));
  store.Remove(ref);
  store.Remove(ref);
  assert(Throws<bridge::util::ValidationError>([&] { store.PayloadBytes(ref); }));
}

} // namespace

int main() {
  TestPutAndRead();
  TestEmptyPayload();
  TestReplaceKeepsEarlierReadersStable();
  TestUnknownReference();

  std::cout << "bridge_unit_ram_payload_store: pass\n";
  return 0;
}
