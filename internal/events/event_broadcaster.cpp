#include "event_broadcaster.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace kiosk::events {

using kiosk::observability::IntField;
using kiosk::observability::StringField;

EventBroadcaster::EventBroadcaster(kiosk::util::ClockFn clock) : clock_(std::move(clock)) {
}

EventBroadcaster::ChannelId EventBroadcaster::Subscribe(std::shared_ptr<EventChannel> channel) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  channels_.emplace(id, std::move(channel));
  KIOSK_LOG_DEBUG("Event listener connected", {IntField("channel", static_cast<int64_t>(id)), IntField("listeners", channels_.size())});
  return id;
}

void EventBroadcaster::Unsubscribe(ChannelId id) {
  std::lock_guard lock(mutex_);
  channels_.erase(id);
  KIOSK_LOG_DEBUG("Event listener closed", {IntField("channel", static_cast<int64_t>(id)), IntField("listeners", channels_.size())});
}

std::size_t EventBroadcaster::Publish(const kiosk::v1::NotificationEvent& event) {
  const auto frame = FormatFrame(event);

  std::vector<std::pair<ChannelId, std::shared_ptr<EventChannel>>> targets;
  {
    std::lock_guard lock(mutex_);
    targets.assign(channels_.begin(), channels_.end());
  }

  std::size_t delivered = 0;
  for (const auto& [id, channel] : targets) {
    try {
      if (channel->Write(frame)) {
        ++delivered;
      } else {
        KIOSK_LOG_DEBUG("Event dropped for listener", {IntField("channel", static_cast<int64_t>(id))});
      }
    } catch (const std::exception& e) {
      KIOSK_LOG_DEBUG("Event write failed", {IntField("channel", static_cast<int64_t>(id)), StringField("error", e.what())});
    }
  }

  KIOSK_LOG_INFO("Event broadcast", {StringField("type", event.type()), StringField("filename", event.filename()),
                                     IntField("delivered", static_cast<int64_t>(delivered)), IntField("listeners", static_cast<int64_t>(targets.size()))});
  return delivered;
}

std::size_t EventBroadcaster::PublishCaptured(const std::string& filename) {
  return Publish(MakeEvent("captured", filename));
}

std::size_t EventBroadcaster::PublishUploaded(const std::string& filename) {
  return Publish(MakeEvent("uploaded", filename));
}

std::size_t EventBroadcaster::PublishFailed() {
  return Publish(MakeEvent("failed", ""));
}

std::size_t EventBroadcaster::ChannelCount() const {
  std::lock_guard lock(mutex_);
  return channels_.size();
}

std::string EventBroadcaster::FormatFrame(const kiosk::v1::NotificationEvent& event) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(event, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize event: " + std::string(status.message()));
  }
  return "data: " + json + "\n\n";
}

kiosk::v1::NotificationEvent EventBroadcaster::MakeEvent(const std::string& type, const std::string& filename) const {
  kiosk::v1::NotificationEvent event;
  event.set_type(type);
  *event.mutable_timestamp() = kiosk::util::ToProto(clock_());
  event.set_filename(filename);
  return event;
}

} // namespace kiosk::events
