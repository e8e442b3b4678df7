#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "capturer.hpp"
#include "internal/util/time.hpp"

namespace kiosk::runtime::config {
class CaptureConfig;
}

namespace kiosk::capture {

/*
  Runs the configured shell pipeline on a worker thread per capture.

  "{output}" in the command is replaced by the shell-quoted output path.
  The command runs in its own process group and is killed as a whole when
  it exceeds the command timeout. Success means exit status 0 and a
  non-empty output file.
*/
class CommandCapturer : public Capturer {
 public:
  CommandCapturer(const kiosk::runtime::config::CaptureConfig& config, kiosk::util::ClockFn clock = kiosk::util::Now);
  ~CommandCapturer() override;

  CommandCapturer(const CommandCapturer&)            = delete;
  CommandCapturer& operator=(const CommandCapturer&) = delete;

  void Capture(CaptureCallback on_settled) override;

  // Waits for in-flight commands.
  void Stop();

  std::string NextFilename() const;

  static std::string ShellQuote(const std::string& value);

 private:
  struct Worker {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  kiosk::model::CaptureOutcome Run(const std::string& filename) const;
  void                         ReapFinished();

  std::string               command_;
  std::filesystem::path     output_dir_;
  std::string               filename_prefix_;
  std::string               extension_;
  std::chrono::milliseconds command_timeout_;
  kiosk::util::ClockFn      clock_;

  std::mutex          workers_mutex_;
  std::vector<Worker> workers_;
};

} // namespace kiosk::capture
