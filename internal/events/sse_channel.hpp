#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "event_channel.hpp"

namespace kiosk::events {

/*
  Bounded outbound queue for one /events connection.

  The broadcaster enqueues; the connection thread drains with Next() and
  writes to the socket. When the queue is full new frames are dropped
  rather than blocking the publisher.
*/
class SseChannel : public EventChannel {
 public:
  explicit SseChannel(std::size_t max_queued);

  bool Write(const std::string& frame) override;

  // Waits up to timeout; nullopt on timeout or once closed and drained.
  std::optional<std::string> Next(std::chrono::milliseconds timeout);

  void Close();
  bool IsClosed() const;

  std::size_t Dropped() const;

 private:
  const std::size_t max_queued_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<std::string> queue_;
  bool                    closed_  = false;
  std::size_t             dropped_ = 0;
};

} // namespace kiosk::events
