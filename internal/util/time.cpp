#include "time.hpp"

#include <cctype>
#include <ctime>
#include <stdexcept>

namespace kiosk::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string LocalIsoDate(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  if (localtime_r(&t, &local) == nullptr) {
    throw std::runtime_error("localtime_r failed");
  }

  char buf[11];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
  return buf;
}

bool IsIsoDate(const std::string& value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
  }
  return true;
}

} // namespace kiosk::util
