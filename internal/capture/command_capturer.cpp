#include "command_capturer.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <exception>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace kiosk::capture {

using kiosk::model::CaptureOutcome;
using kiosk::observability::IntField;
using kiosk::observability::StringField;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

} // namespace

CommandCapturer::CommandCapturer(const kiosk::runtime::config::CaptureConfig& config, kiosk::util::ClockFn clock)
    : command_(config.command()),
      output_dir_(config.output_dir()),
      filename_prefix_(config.filename_prefix()),
      extension_(config.extension()),
      command_timeout_(config.command_timeout_ms()),
      clock_(std::move(clock)) {
}

CommandCapturer::~CommandCapturer() {
  Stop();
}

void CommandCapturer::Capture(CaptureCallback on_settled) {
  ReapFinished();

  auto filename = NextFilename();
  auto done     = std::make_shared<std::atomic<bool>>(false);

  std::thread thread([this, filename, done, on_settled = std::move(on_settled)] {
    CaptureOutcome outcome;
    try {
      outcome = Run(filename);
    } catch (const std::exception& e) {
      outcome = CaptureOutcome::Failed(e.what());
    }
    on_settled(std::move(outcome));
    *done = true;
  });

  std::lock_guard lock(workers_mutex_);
  workers_.push_back(Worker{std::move(thread), std::move(done)});
}

void CommandCapturer::Stop() {
  std::vector<Worker> workers;
  {
    std::lock_guard lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

std::string CommandCapturer::NextFilename() const {
  const auto        now    = clock_();
  const std::time_t t      = kiosk::util::Clock::to_time_t(now);
  const auto        millis = kiosk::util::ToUnixMillis(now) % 1000;

  std::tm utc{};
  gmtime_r(&t, &utc);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H-%M-%S", &utc);

  char suffix[8];
  std::snprintf(suffix, sizeof(suffix), "-%03dZ", static_cast<int>(millis));

  return filename_prefix_ + stamp + suffix + extension_;
}

std::string CommandCapturer::ShellQuote(const std::string& value) {
  return "'" + ReplaceAll(value, "'", "'\\''") + "'";
}

// ------------------------------------------------------------
// Worker side
// ------------------------------------------------------------

CaptureOutcome CommandCapturer::Run(const std::string& filename) const {
  std::filesystem::create_directories(output_dir_);

  const auto output_path = output_dir_ / filename;
  const auto command     = ReplaceAll(command_, "{output}", ShellQuote(output_path.string()));

  KIOSK_LOG_INFO("Capture started", {StringField("filename", filename)});

  const pid_t pid = fork();
  if (pid < 0) {
    return CaptureOutcome::Failed(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    setpgid(0, 0);
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }
  setpgid(pid, pid);

  const auto deadline = std::chrono::steady_clock::now() + command_timeout_;
  int        status   = 0;
  for (;;) {
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) break;
    if (waited < 0 && errno != EINTR) {
      return CaptureOutcome::Failed(std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      waitpid(pid, &status, 0);
      KIOSK_LOG_ERROR("Capture command timed out", {StringField("filename", filename), IntField("timeout_ms", command_timeout_.count())});
      return CaptureOutcome::Failed("capture command timed out");
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    KIOSK_LOG_ERROR("Capture command failed", {StringField("filename", filename), IntField("exit_code", code)});
    return CaptureOutcome::Failed("capture command exited with " + std::to_string(code));
  }

  std::error_code ec;
  const auto      size = std::filesystem::file_size(output_path, ec);
  if (ec || size == 0) {
    return CaptureOutcome::Failed("capture produced no image");
  }

  KIOSK_LOG_INFO("Capture finished", {StringField("filename", filename), IntField("bytes", static_cast<int64_t>(size))});
  return CaptureOutcome::Succeeded(filename);
}

void CommandCapturer::ReapFinished() {
  std::lock_guard lock(workers_mutex_);
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (*it->done) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace kiosk::capture
