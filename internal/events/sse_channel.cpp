#include "sse_channel.hpp"

namespace kiosk::events {

SseChannel::SseChannel(std::size_t max_queued) : max_queued_(max_queued) {
}

bool SseChannel::Write(const std::string& frame) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    if (queue_.size() >= max_queued_) {
      ++dropped_;
      return false;
    }
    queue_.push_back(frame);
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> SseChannel::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  auto frame = std::move(queue_.front());
  queue_.pop_front();
  return frame;
}

void SseChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool SseChannel::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::size_t SseChannel::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace kiosk::events
