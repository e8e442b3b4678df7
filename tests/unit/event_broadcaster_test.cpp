#include "internal/events/event_broadcaster.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/events/sse_channel.hpp"
#include "unit/test_fakes.hpp"

using kiosk::events::EventBroadcaster;
using kiosk::events::SseChannel;
using kiosk::testing::FakeClock;
using kiosk::testing::RecordingChannel;
using namespace std::chrono_literals;

namespace {

google::protobuf::Struct ParseFrame(const std::string& frame) {
  const std::string prefix = "data: ";
  assert(frame.compare(0, prefix.size(), prefix) == 0);
  assert(frame.size() > prefix.size() + 2 && frame.substr(frame.size() - 2) == "\n\n");

  const auto               json = frame.substr(prefix.size(), frame.size() - prefix.size() - 2);
  google::protobuf::Struct doc;
  const bool               ok = google::protobuf::util::JsonStringToMessage(json, &doc).ok();
  assert(ok);
  return doc;
}

void TestCapturedEventReachesEveryListener() {
  FakeClock        clock;
  EventBroadcaster broadcaster(clock.Fn());

  auto first  = std::make_shared<RecordingChannel>();
  auto second = std::make_shared<RecordingChannel>();
  broadcaster.Subscribe(first);
  broadcaster.Subscribe(second);

  assert(broadcaster.PublishCaptured("capture_1.webp") == 2);

  for (const auto& channel : {first, second}) {
    const auto frames = channel->Frames();
    assert(frames.size() == 1);

    auto doc = ParseFrame(frames[0]);
    assert(doc.fields().at("type").string_value() == "captured");
    assert(doc.fields().at("filename").string_value() == "capture_1.webp");

    const auto& timestamp = doc.fields().at("timestamp").string_value();
    assert(timestamp.size() >= 20 && timestamp.back() == 'Z');
  }
}

void TestFailingListenerIsSkippedNotRemoved() {
  FakeClock        clock;
  EventBroadcaster broadcaster(clock.Fn());

  auto healthy  = std::make_shared<RecordingChannel>();
  auto throwing = std::make_shared<RecordingChannel>();
  auto refusing = std::make_shared<RecordingChannel>();
  throwing->throw_on_write = true;
  refusing->accept         = false;

  broadcaster.Subscribe(throwing);
  broadcaster.Subscribe(healthy);
  broadcaster.Subscribe(refusing);

  assert(broadcaster.PublishUploaded("capture_2.webp") == 1);
  assert(healthy->Frames().size() == 1);
  assert(broadcaster.ChannelCount() == 3);

  auto doc = ParseFrame(healthy->Frames()[0]);
  assert(doc.fields().at("type").string_value() == "uploaded");
}

void TestUnsubscribedListenerGetsNothing() {
  FakeClock        clock;
  EventBroadcaster broadcaster(clock.Fn());

  auto channel = std::make_shared<RecordingChannel>();
  const auto id = broadcaster.Subscribe(channel);
  broadcaster.Unsubscribe(id);

  assert(broadcaster.ChannelCount() == 0);
  assert(broadcaster.PublishCaptured("capture_3.webp") == 0);
  assert(channel->Frames().empty());
}

void TestSseChannelIsBounded() {
  SseChannel channel(2);
  assert(channel.Write("a"));
  assert(channel.Write("b"));
  assert(!channel.Write("c"));
  assert(channel.Dropped() == 1);

  assert(channel.Next(10ms).value() == "a");
  assert(channel.Next(10ms).value() == "b");
  assert(!channel.Next(10ms).has_value());

  channel.Close();
  assert(channel.IsClosed());
  assert(!channel.Write("d"));
}

void TestPublishingToSseChannelNeverBlocks() {
  FakeClock        clock;
  EventBroadcaster broadcaster(clock.Fn());

  auto channel = std::make_shared<SseChannel>(1);
  broadcaster.Subscribe(channel);

  assert(broadcaster.PublishCaptured("one.webp") == 1);
  assert(broadcaster.PublishCaptured("two.webp") == 0);
  assert(channel->Dropped() == 1);

  auto frame = channel->Next(10ms);
  assert(frame.has_value());
  assert(ParseFrame(*frame).fields().at("filename").string_value() == "one.webp");
}

} // namespace

int main() {
  TestCapturedEventReachesEveryListener();
  TestFailingListenerIsSkippedNotRemoved();
  TestUnsubscribedListenerGetsNothing();
  TestSseChannelIsBounded();
  TestPublishingToSseChannelNeverBlocks();

  std::cout << "shot_kiosk_unit_event_broadcaster: pass\n";
  return 0;
}
