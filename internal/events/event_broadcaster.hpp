#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "event_channel.hpp"
#include "internal/util/time.hpp"
#include "kiosk/v1.hpp"

namespace kiosk::events {

/*
  Fans notification events out to every open channel.

  Delivery is best effort: a channel that rejects or throws is skipped,
  never retried, and stays registered until its connection unsubscribes.
*/
class EventBroadcaster {
 public:
  using ChannelId = std::uint64_t;

  explicit EventBroadcaster(kiosk::util::ClockFn clock = kiosk::util::Now);

  ChannelId Subscribe(std::shared_ptr<EventChannel> channel);
  void      Unsubscribe(ChannelId id);

  // Returns the number of channels that accepted the frame.
  std::size_t Publish(const kiosk::v1::NotificationEvent& event);

  std::size_t PublishCaptured(const std::string& filename);
  std::size_t PublishUploaded(const std::string& filename);
  // Only sent when failure notification is enabled; carries no filename.
  std::size_t PublishFailed();

  std::size_t ChannelCount() const;

  // "data: <json>\n\n"
  static std::string FormatFrame(const kiosk::v1::NotificationEvent& event);

 private:
  kiosk::v1::NotificationEvent MakeEvent(const std::string& type, const std::string& filename) const;

  kiosk::util::ClockFn clock_;

  mutable std::mutex                              mutex_;
  std::map<ChannelId, std::shared_ptr<EventChannel>> channels_;
  ChannelId                                       next_id_ = 1;
};

} // namespace kiosk::events
