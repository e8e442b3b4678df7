#include "internal/quota/quota_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"
#include "unit/test_fakes.hpp"

using kiosk::quota::QuotaStore;
using kiosk::testing::FakeClock;
using kiosk::testing::FreshDirectory;
using kiosk::testing::LocalNoon;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path);
  out << content;
}

google::protobuf::Struct ReadState(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::Struct doc;
  const bool               ok = google::protobuf::util::JsonStringToMessage(buffer.str(), &doc).ok();
  assert(ok);
  return doc;
}

void TestMissingFileStartsFreshAndPersists() {
  const auto dir = FreshDirectory("quota_missing");
  FakeClock  clock;
  QuotaStore store(dir / "state.json", 10, clock.Fn());

  auto record = store.Load();
  assert(record.date() == "2024-05-17");
  assert(record.shots_remaining() == 10);

  auto doc = ReadState(dir / "state.json");
  assert(doc.fields().at("date").string_value() == "2024-05-17");
  assert(doc.fields().at("shotsRemaining").number_value() == 10);
  assert(!std::filesystem::exists(dir / "state.json.tmp"));
}

void TestStoredRecordIsLoadedAndClamped() {
  const auto dir = FreshDirectory("quota_clamp");
  FakeClock  clock;
  QuotaStore store(dir / "state.json", 10, clock.Fn());

  WriteFile(dir / "state.json", R"({"date":"2024-05-17","shotsRemaining":4})");
  assert(store.Load().shots_remaining() == 4);

  WriteFile(dir / "state.json", R"({"date":"2024-05-17","shotsRemaining":25})");
  assert(store.Load().shots_remaining() == 10);

  WriteFile(dir / "state.json", R"({"date":"2024-05-17","shotsRemaining":-3})");
  assert(store.Load().shots_remaining() == 0);
}

void TestSchemaInvalidFilesStartFresh() {
  const auto dir = FreshDirectory("quota_invalid");
  FakeClock  clock;
  QuotaStore store(dir / "state.json", 10, clock.Fn());

  const char* invalid[] = {
      "not json at all",
      "[1, 2, 3]",
      R"({"date":"17/05/2024","shotsRemaining":3})",
      R"({"date":"2024-05-17","shotsRemaining":"3"})",
      R"({"date":"2024-05-17"})",
      R"({"shotsRemaining":3})",
  };

  for (const char* content : invalid) {
    WriteFile(dir / "state.json", content);
    auto record = store.Load();
    assert(record.date() == "2024-05-17");
    assert(record.shots_remaining() == 10);
  }

  // the fresh record replaced the bad file
  auto doc = ReadState(dir / "state.json");
  assert(doc.fields().at("shotsRemaining").number_value() == 10);
}

void TestRecordRollsOverToToday() {
  const auto dir = FreshDirectory("quota_rollover");
  FakeClock  clock;
  QuotaStore store(dir / "state.json", 10, clock.Fn());

  WriteFile(dir / "state.json", R"({"date":"2024-05-17","shotsRemaining":0})");
  auto record = store.Load();
  assert(!store.CanCapture(record));

  clock.now = LocalNoon(2024, 5, 18);
  assert(store.CanCapture(record));
  assert(record.date() == "2024-05-18");
  assert(record.shots_remaining() == 10);

  auto doc = ReadState(dir / "state.json");
  assert(doc.fields().at("date").string_value() == "2024-05-18");
}

void TestDecrementStopsAtZero() {
  const auto dir = FreshDirectory("quota_decrement");
  FakeClock  clock;
  QuotaStore store(dir / "state.json", 2, clock.Fn());

  auto record = store.Load();
  store.Decrement(record);
  assert(record.shots_remaining() == 1);
  assert(store.CanCapture(record));

  store.Decrement(record);
  assert(record.shots_remaining() == 0);
  assert(!store.CanCapture(record));

  store.Decrement(record);
  assert(record.shots_remaining() == 0);

  auto doc = ReadState(dir / "state.json");
  assert(doc.fields().at("shotsRemaining").number_value() == 0);
}

void TestStaleTempFileIsReplacedDurably() {
  const auto dir = FreshDirectory("quota_stale_tmp");
  FakeClock  clock;
  QuotaStore store(dir / "state.json", 5, clock.Fn());

  auto record = store.Load();

  // leftover from a write that never reached the rename
  WriteFile(dir / "state.json.tmp", std::string(4096, 'x'));

  store.Decrement(record);
  assert(!std::filesystem::exists(dir / "state.json.tmp"));

  auto doc = ReadState(dir / "state.json");
  assert(doc.fields().at("shotsRemaining").number_value() == 4);

  QuotaStore reopened(dir / "state.json", 5, clock.Fn());
  auto       reloaded = reopened.Load();
  assert(reloaded.date() == record.date());
  assert(reloaded.shots_remaining() == 4);
}

void TestWriteFailureKeepsMemoryState() {
  const auto dir = FreshDirectory("quota_unwritable");
  FakeClock  clock;
  QuotaStore store(dir / "missing" / "state.json", 10, clock.Fn());

  // fresh record cannot be written; Load still succeeds
  auto record = store.Load();
  assert(record.shots_remaining() == 10);

  bool threw = false;
  try {
    store.Decrement(record);
  } catch (const kiosk::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);
  assert(record.shots_remaining() == 9);
}

} // namespace

int main() {
  TestMissingFileStartsFreshAndPersists();
  TestStoredRecordIsLoadedAndClamped();
  TestSchemaInvalidFilesStartFresh();
  TestRecordRollsOverToToday();
  TestDecrementStopsAtZero();
  TestStaleTempFileIsReplacedDurably();
  TestWriteFailureKeepsMemoryState();

  std::cout << "shot_kiosk_unit_quota_store: pass\n";
  return 0;
}
