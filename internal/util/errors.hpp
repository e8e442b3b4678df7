#pragma once

#include <stdexcept>
#include <string>

namespace kiosk::util {

/*
  Central error types for collaborator seams.

  The orchestrator folds these into a terminal display phase and a
  CaptureResult. Busy and limit-reached rejections are never thrown;
  they are CaptureStatus values. The HTTP layer turns results into
  status codes.
*/

class CaptureFailure : public std::runtime_error {
 public:
  explicit CaptureFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DisplayUnavailable : public std::runtime_error {
 public:
  explicit DisplayUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace kiosk::util
