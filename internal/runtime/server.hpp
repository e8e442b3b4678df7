#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/http/http_message.hpp"

namespace kiosk::runtime {

/*
  Minimal blocking HTTP/1.1 server.

  One acceptor thread, one thread per connection, one request per
  connection. Handlers run on the connection thread and may block (a
  capture request waits for its result) or stream (Server-Sent Events).
  Stop() closes the listener, shuts down every open connection and joins
  all threads.
*/
class Server {
 public:
  using Handler = std::function<kiosk::http::HttpResponse(const kiosk::http::HttpRequest&)>;

  // port 0 binds an ephemeral port; see BoundPort().
  Server(std::string bind_address, std::uint16_t port, Handler handler);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  std::uint16_t BoundPort() const {
    return bound_port_;
  }

 private:
  struct Connection {
    int               fd = -1;
    std::thread       thread;
    std::atomic<bool> done{false};
  };

  void AcceptLoop();
  void Serve(Connection& connection);
  void ReapFinished();

  std::string   bind_address_;
  std::uint16_t port_;
  Handler       handler_;

  int               listen_fd_  = -1;
  std::uint16_t     bound_port_ = 0;
  std::atomic<bool> running_{false};
  std::thread       acceptor_;

  std::mutex                             connections_mutex_;
  std::list<std::unique_ptr<Connection>> connections_;

  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
  bool                    stopped_ = false;
};

} // namespace kiosk::runtime
