#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace google::protobuf {
class Struct;
}

namespace kiosk::http {

struct HttpRequest {
  std::string                        method;
  std::string                        path;
  std::string                        query;
  std::map<std::string, std::string> headers; // keys lower-cased
  std::string                        body;

  // Empty when absent. name is matched case-insensitively.
  std::string Header(std::string_view name) const;
};

/*
  Sink for streamed response bodies. Write() returns false once the peer
  is gone or the server is shutting down.
*/
class StreamWriter {
 public:
  virtual ~StreamWriter() = default;
  virtual bool Write(std::string_view data) = 0;
};

struct HttpResponse {
  int                                status       = 200;
  std::string                        content_type = "application/json";
  std::map<std::string, std::string> headers;
  std::string                        body;

  // When set the body is produced incrementally and the connection is
  // closed when the function returns; body is ignored.
  std::function<void(StreamWriter&)> stream;

  static HttpResponse Json(int status, const google::protobuf::Struct& body);
  // {"ok":false,"error":message}
  static HttpResponse Error(int status, std::string_view message);

  // Status line and headers; includes Content-Length unless streaming.
  std::string SerializeHead() const;
  std::string Serialize() const;
};

std::string_view ReasonPhrase(int status);

enum class ParseStatus {
  kComplete,
  kIncomplete,
  kMalformed,
};

constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
constexpr std::size_t kMaxBodyBytes   = 64 * 1024;

/*
  Parses one HTTP/1.x request from the front of buffer. On kComplete,
  *consumed is the number of bytes the request occupied.
*/
ParseStatus ParseRequest(std::string_view buffer, HttpRequest* request, std::size_t* consumed);

} // namespace kiosk::http
