#pragma once

#include <string>

namespace kiosk::events {

/*
  One listener connection as seen by the broadcaster.

  Write() must not block; implementations queue or drop.
*/
class EventChannel {
 public:
  virtual ~EventChannel() = default;

  // Returns false when the frame was not accepted.
  virtual bool Write(const std::string& frame) = 0;
};

} // namespace kiosk::events
