#include "pipe_display_driver.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace kiosk::display {

using kiosk::observability::IntField;
using kiosk::observability::StringField;
using kiosk::util::DisplayUnavailable;

namespace {

std::string Errno(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

} // namespace

PipeDisplayDriver::PipeDisplayDriver(std::string helper_command, std::chrono::milliseconds command_timeout)
    : helper_command_(std::move(helper_command)), command_timeout_(command_timeout) {
}

PipeDisplayDriver::~PipeDisplayDriver() {
  std::lock_guard lock(mutex_);
  Terminate();
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

void PipeDisplayDriver::Present(const kiosk::model::DisplayPhase& phase, const std::vector<TextElement>& text) {
  google::protobuf::Struct command;
  auto&                    fields = *command.mutable_fields();
  fields["action"].set_string_value("frame");
  fields["phase"].set_string_value(std::string(kiosk::model::PhaseName(phase.kind)));

  auto* elements = fields["elements"].mutable_list_value();
  for (const auto& element : text) {
    auto& entry = *elements->add_values()->mutable_struct_value()->mutable_fields();
    entry["x"].set_number_value(element.x);
    entry["y"].set_number_value(element.y);
    entry["size"].set_number_value(element.size);
    entry["text"].set_string_value(element.text);
  }

  Send(command);
}

void PipeDisplayDriver::DrawPixels(const std::vector<Pixel>& pixels) {
  if (pixels.empty()) return;

  google::protobuf::Struct command;
  auto&                    fields = *command.mutable_fields();
  fields["action"].set_string_value("pixels");

  auto* points = fields["points"].mutable_list_value();
  for (const auto& pixel : pixels) {
    auto* point = points->add_values()->mutable_list_value();
    point->add_values()->set_number_value(pixel.x);
    point->add_values()->set_number_value(pixel.y);
    point->add_values()->set_number_value(pixel.on ? 1 : 0);
  }

  Send(command);
}

void PipeDisplayDriver::Send(const google::protobuf::Struct& command) {
  std::string line;
  if (!google::protobuf::util::MessageToJsonString(command, &line).ok()) {
    throw DisplayUnavailable("failed to encode display command");
  }
  line.push_back('\n');

  std::lock_guard lock(mutex_);
  try {
    EnsureStarted();
    WriteAll(line);
    AwaitAck(std::chrono::steady_clock::now() + command_timeout_);
  } catch (const DisplayUnavailable&) {
    Terminate();
    throw;
  }
}

// ------------------------------------------------------------
// Helper process
// ------------------------------------------------------------

void PipeDisplayDriver::EnsureStarted() {
  if (pid_ > 0) return;

  int in_pipe[2];
  int out_pipe[2];
  if (pipe2(in_pipe, O_CLOEXEC) != 0) {
    throw DisplayUnavailable(Errno("pipe"));
  }
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    close(in_pipe[0]);
    close(in_pipe[1]);
    throw DisplayUnavailable(Errno("pipe"));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(in_pipe[0]);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw DisplayUnavailable(Errno("fork"));
  }

  if (pid == 0) {
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    execl("/bin/sh", "sh", "-c", helper_command_.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }

  close(in_pipe[0]);
  close(out_pipe[1]);
  pid_         = pid;
  to_helper_   = in_pipe[1];
  from_helper_ = out_pipe[0];
  read_buffer_.clear();

  KIOSK_LOG_INFO("Display helper started", {StringField("command", helper_command_), IntField("pid", pid_)});
}

void PipeDisplayDriver::Terminate() {
  if (to_helper_ >= 0) close(to_helper_);
  if (from_helper_ >= 0) close(from_helper_);
  to_helper_   = -1;
  from_helper_ = -1;

  if (pid_ > 0) {
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
  }
}

void PipeDisplayDriver::WriteAll(const std::string& data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = write(to_helper_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw DisplayUnavailable(Errno("display helper write"));
    }
    written += static_cast<std::size_t>(n);
  }
}

void PipeDisplayDriver::AwaitAck(std::chrono::steady_clock::time_point deadline) {
  for (;;) {
    const auto newline = read_buffer_.find('\n');
    if (newline != std::string::npos) {
      const auto line = read_buffer_.substr(0, newline);
      read_buffer_.erase(0, newline + 1);

      google::protobuf::Struct reply;
      if (!google::protobuf::util::JsonStringToMessage(line, &reply).ok()) continue;

      const auto& fields = reply.fields();
      auto        status = fields.find("status");
      if (status == fields.end()) continue;

      if (status->second.string_value() == "ok") return;

      auto message = fields.find("message");
      throw DisplayUnavailable("display helper error: " + (message != fields.end() ? message->second.string_value() : std::string("unknown")));
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw DisplayUnavailable("display helper timed out");
    }

    pollfd pfd{from_helper_, POLLIN, 0};
    const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw DisplayUnavailable(Errno("poll"));
    }
    if (ready == 0) continue;

    char          chunk[512];
    const ssize_t n = read(from_helper_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw DisplayUnavailable(Errno("display helper read"));
    }
    if (n == 0) {
      throw DisplayUnavailable("display helper exited");
    }
    read_buffer_.append(chunk, static_cast<std::size_t>(n));
  }
}

} // namespace kiosk::display
