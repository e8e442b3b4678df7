#include "server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace kiosk::runtime {

using kiosk::http::HttpRequest;
using kiosk::http::HttpResponse;
using kiosk::http::ParseStatus;
using kiosk::observability::IntField;
using kiosk::observability::StringField;

namespace {

constexpr int         kPollIntervalMs = 200;
constexpr int         kReadTimeoutMs  = 5000;
constexpr int         kListenBacklog  = 16;
constexpr std::size_t kReadChunk      = 4096;

bool SendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

class SocketStreamWriter final : public kiosk::http::StreamWriter {
 public:
  SocketStreamWriter(int fd, const std::atomic<bool>& running) : fd_(fd), running_(running) {
  }

  bool Write(std::string_view data) override {
    if (!running_.load() || failed_) return false;
    failed_ = !SendAll(fd_, data);
    return !failed_;
  }

 private:
  int                      fd_;
  const std::atomic<bool>& running_;
  bool                     failed_ = false;
};

} // namespace

Server::Server(std::string bind_address, std::uint16_t port, Handler handler)
    : bind_address_(std::move(bind_address)), port_(port), handler_(std::move(handler)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    throw std::runtime_error("socket() failed: " + std::string(std::strerror(errno)));
  }

  int reuse = 1;
  ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port_);
  if (::inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    throw std::runtime_error("Invalid bind address: " + bind_address_);
  }

  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listen_fd_, kListenBacklog) != 0) {
    const std::string error = std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    throw std::runtime_error("Failed to listen on " + bind_address_ + ":" + std::to_string(port_) + ": " + error);
  }

  sockaddr_in bound{};
  socklen_t   length = sizeof(bound);
  ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &length);
  bound_port_ = ntohs(bound.sin_port);

  {
    std::lock_guard lock(wait_mutex_);
    stopped_ = false;
  }
  running_.store(true);
  acceptor_ = std::thread([this] { AcceptLoop(); });

  KIOSK_LOG_INFO("Shot kiosk listening", {StringField("address", bind_address_), IntField("port", bound_port_)});
}

void Server::Wait() {
  std::unique_lock lock(wait_mutex_);
  wait_cv_.wait(lock, [this] { return stopped_; });
}

void Server::Stop() {
  if (!running_.exchange(false)) return;

  if (acceptor_.joinable()) acceptor_.join();
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  std::list<std::unique_ptr<Connection>> connections;
  {
    std::lock_guard lock(connections_mutex_);
    connections.swap(connections_);
  }
  for (auto& connection : connections) {
    ::shutdown(connection->fd, SHUT_RDWR);
  }
  for (auto& connection : connections) {
    if (connection->thread.joinable()) connection->thread.join();
    ::close(connection->fd);
  }

  {
    std::lock_guard lock(wait_mutex_);
    stopped_ = true;
  }
  wait_cv_.notify_all();

  KIOSK_LOG_INFO("HTTP server stopped");
}

// ------------------------------------------------------------
// Acceptor
// ------------------------------------------------------------

void Server::AcceptLoop() {
  while (running_.load()) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kPollIntervalMs);
    ReapFinished();
    if (ready <= 0) continue;

    const int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN) {
        KIOSK_LOG_WARN("accept() failed", {StringField("error", std::strerror(errno))});
      }
      continue;
    }

    auto  connection = std::make_unique<Connection>();
    auto* raw        = connection.get();
    raw->fd          = fd;

    std::lock_guard lock(connections_mutex_);
    connections_.push_back(std::move(connection));
    raw->thread = std::thread([this, raw] { Serve(*raw); });
  }
}

void Server::ReapFinished() {
  std::list<std::unique_ptr<Connection>> finished;
  {
    std::lock_guard lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if ((*it)->done.load()) {
        finished.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection->thread.joinable()) connection->thread.join();
    ::close(connection->fd);
  }
}

// ------------------------------------------------------------
// Connection
// ------------------------------------------------------------

void Server::Serve(Connection& connection) {
  const int   fd = connection.fd;
  std::string buffer;
  HttpRequest request;
  std::size_t consumed = 0;
  ParseStatus status   = ParseStatus::kIncomplete;

  while (status == ParseStatus::kIncomplete && running_.load()) {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, kReadTimeoutMs) <= 0) break;

    char       chunk[kReadChunk];
    const auto n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n <= 0) break;

    buffer.append(chunk, static_cast<std::size_t>(n));
    status = kiosk::http::ParseRequest(buffer, &request, &consumed);
  }

  if (status == ParseStatus::kMalformed) {
    SendAll(fd, HttpResponse::Error(400, "Bad request").Serialize());
  } else if (status == ParseStatus::kComplete) {
    HttpResponse response;
    try {
      response = handler_(request);
    } catch (const std::exception& e) {
      KIOSK_LOG_ERROR("Request handler failed", {StringField("path", request.path), StringField("error", e.what())});
      response = HttpResponse::Error(500, "Internal error");
    }

    KIOSK_LOG_DEBUG("HTTP request", {StringField("method", request.method), StringField("path", request.path), IntField("status", response.status)});

    if (response.stream) {
      if (SendAll(fd, response.SerializeHead())) {
        SocketStreamWriter writer(fd, running_);
        try {
          response.stream(writer);
        } catch (const std::exception& e) {
          KIOSK_LOG_ERROR("Stream handler failed", {StringField("path", request.path), StringField("error", e.what())});
        }
      }
    } else {
      SendAll(fd, response.Serialize());
    }
  }

  // the fd is closed by whoever joins this thread
  ::shutdown(fd, SHUT_RDWR);
  connection.done.store(true);
}

} // namespace kiosk::runtime
