#include "http_message.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>

namespace kiosk::http {

namespace {

constexpr std::string_view kCrlf    = "\r\n";
constexpr std::string_view kHeadEnd = "\r\n\r\n";

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);
  return value;
}

bool IsToken(std::string_view value) {
  if (value.empty()) return false;
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isupper(c) != 0; });
}

} // namespace

std::string HttpRequest::Header(std::string_view name) const {
  auto it = headers.find(Lower(name));
  return it == headers.end() ? std::string() : it->second;
}

// ------------------------------------------------------------
// Responses
// ------------------------------------------------------------

HttpResponse HttpResponse::Json(int status, const google::protobuf::Struct& body) {
  HttpResponse response;
  response.status = status;

  auto result = google::protobuf::util::MessageToJsonString(body, &response.body);
  if (!result.ok()) {
    throw std::runtime_error("Failed to serialize response: " + std::string(result.message()));
  }
  return response;
}

HttpResponse HttpResponse::Error(int status, std::string_view message) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["ok"].set_bool_value(false);
  (*body.mutable_fields())["error"].set_string_value(std::string(message));
  return Json(status, body);
}

std::string HttpResponse::SerializeHead() const {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << ' ' << ReasonPhrase(status) << kCrlf;
  out << "Content-Type: " << content_type << kCrlf;
  if (!stream) {
    out << "Content-Length: " << body.size() << kCrlf;
  }
  for (const auto& [name, value] : headers) {
    out << name << ": " << value << kCrlf;
  }
  out << "Connection: close" << kCrlf << kCrlf;
  return out.str();
}

std::string HttpResponse::Serialize() const {
  return SerializeHead() + body;
}

std::string_view ReasonPhrase(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 409:
      return "Conflict";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
  }
  return "Unknown";
}

// ------------------------------------------------------------
// Parsing
// ------------------------------------------------------------

ParseStatus ParseRequest(std::string_view buffer, HttpRequest* request, std::size_t* consumed) {
  const auto head_end = buffer.find(kHeadEnd);
  if (head_end == std::string_view::npos) {
    return buffer.size() > kMaxHeaderBytes ? ParseStatus::kMalformed : ParseStatus::kIncomplete;
  }
  if (head_end > kMaxHeaderBytes) return ParseStatus::kMalformed;

  std::string_view head = buffer.substr(0, head_end);

  // request line
  const auto       line_end = head.find(kCrlf);
  std::string_view line = head.substr(0, line_end);
  head                  = line_end == std::string_view::npos ? std::string_view() : head.substr(line_end + kCrlf.size());

  const auto first_space = line.find(' ');
  const auto last_space  = line.rfind(' ');
  if (first_space == std::string_view::npos || first_space == last_space) return ParseStatus::kMalformed;

  std::string_view method  = line.substr(0, first_space);
  std::string_view target  = line.substr(first_space + 1, last_space - first_space - 1);
  std::string_view version = line.substr(last_space + 1);

  if (!IsToken(method) || target.empty() || target.front() != '/') return ParseStatus::kMalformed;
  if (version != "HTTP/1.1" && version != "HTTP/1.0") return ParseStatus::kMalformed;

  HttpRequest parsed;
  parsed.method = std::string(method);

  const auto question = target.find('?');
  parsed.path         = std::string(target.substr(0, question));
  if (question != std::string_view::npos) parsed.query = std::string(target.substr(question + 1));

  // headers
  while (!head.empty()) {
    const auto       end    = head.find(kCrlf);
    std::string_view header = head.substr(0, end);
    head                    = end == std::string_view::npos ? std::string_view() : head.substr(end + kCrlf.size());

    const auto colon = header.find(':');
    if (colon == std::string_view::npos || colon == 0) return ParseStatus::kMalformed;
    parsed.headers[Lower(Trim(header.substr(0, colon)))] = std::string(Trim(header.substr(colon + 1)));
  }

  if (!parsed.Header("transfer-encoding").empty()) return ParseStatus::kMalformed;

  std::size_t content_length = 0;
  const auto  length_header  = parsed.Header("content-length");
  if (!length_header.empty()) {
    const auto* first  = length_header.data();
    const auto* last   = first + length_header.size();
    auto [ptr, ec]     = std::from_chars(first, last, content_length);
    if (ec != std::errc() || ptr != last || content_length > kMaxBodyBytes) return ParseStatus::kMalformed;
  }

  const auto body_start = head_end + kHeadEnd.size();
  if (buffer.size() - body_start < content_length) return ParseStatus::kIncomplete;

  parsed.body = std::string(buffer.substr(body_start, content_length));
  *request    = std::move(parsed);
  *consumed   = body_start + content_length;
  return ParseStatus::kComplete;
}

} // namespace kiosk::http
