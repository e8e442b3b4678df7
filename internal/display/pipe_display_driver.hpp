#pragma once

#include <sys/types.h>

#include <chrono>
#include <mutex>
#include <string>

#include "display_driver.hpp"

namespace google::protobuf {
class Struct;
}

namespace kiosk::display {

/*
  Drives a persistent helper process that owns the panel.

  Protocol: one JSON object per line on the helper's stdin, one
  {"status":"ok"|"error", "message":...} line back per command. Lines that
  are not a status object (start-up banners) are skipped.

  A command that fails or is not acknowledged within the timeout throws
  util::DisplayUnavailable; the helper is then killed and restarted on
  the next command.
*/
class PipeDisplayDriver : public DisplayDriver {
 public:
  PipeDisplayDriver(std::string helper_command, std::chrono::milliseconds command_timeout);
  ~PipeDisplayDriver() override;

  PipeDisplayDriver(const PipeDisplayDriver&)            = delete;
  PipeDisplayDriver& operator=(const PipeDisplayDriver&) = delete;

  void Present(const kiosk::model::DisplayPhase& phase, const std::vector<TextElement>& text) override;
  void DrawPixels(const std::vector<Pixel>& pixels) override;

 private:
  void Send(const google::protobuf::Struct& command);
  void EnsureStarted();
  void Terminate();
  void WriteAll(const std::string& data);
  void AwaitAck(std::chrono::steady_clock::time_point deadline);

  std::string               helper_command_;
  std::chrono::milliseconds command_timeout_;

  std::mutex  mutex_;
  pid_t       pid_         = -1;
  int         to_helper_   = -1;
  int         from_helper_ = -1;
  std::string read_buffer_;
};

} // namespace kiosk::display
