#include "quota_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace kiosk::quota {

using kiosk::observability::IntField;
using kiosk::observability::StringField;
using kiosk::v1::QuotaRecord;

namespace {

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

/*
  Accepts {"date": "YYYY-MM-DD", "shotsRemaining": <number>} only.
  Parsed through Struct so a missing field is told apart from a zero.
*/
std::optional<QuotaRecord> ParseRecord(const std::string& raw, uint32_t daily_limit) {
  google::protobuf::Struct doc;
  if (!google::protobuf::util::JsonStringToMessage(raw, &doc).ok()) {
    return std::nullopt;
  }

  const auto& fields = doc.fields();
  auto        date   = fields.find("date");
  auto        shots  = fields.find("shotsRemaining");
  if (date == fields.end() || shots == fields.end()) return std::nullopt;
  if (date->second.kind_case() != google::protobuf::Value::kStringValue) return std::nullopt;
  if (shots->second.kind_case() != google::protobuf::Value::kNumberValue) return std::nullopt;
  if (!kiosk::util::IsIsoDate(date->second.string_value())) return std::nullopt;

  const double value = shots->second.number_value();
  if (!std::isfinite(value)) return std::nullopt;

  QuotaRecord record;
  record.set_date(date->second.string_value());
  record.set_shots_remaining(static_cast<int32_t>(std::clamp(std::floor(value), 0.0, static_cast<double>(daily_limit))));
  return record;
}

void WriteDurably(const std::filesystem::path& path, const std::string& data) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw kiosk::util::PersistenceError("failed to open " + path.string() + ": " + std::strerror(errno));
  }

  std::size_t written = 0;
  while (written < data.size()) {
    const auto n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      const std::string error = std::strerror(errno);
      ::close(fd);
      throw kiosk::util::PersistenceError("failed to write " + path.string() + ": " + error);
    }
    written += static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0) {
    const std::string error = std::strerror(errno);
    ::close(fd);
    throw kiosk::util::PersistenceError("failed to sync " + path.string() + ": " + error);
  }
  if (::close(fd) != 0) {
    throw kiosk::util::PersistenceError("failed to close " + path.string() + ": " + std::strerror(errno));
  }
}

} // namespace

QuotaStore::QuotaStore(std::filesystem::path path, uint32_t daily_limit, kiosk::util::ClockFn clock)
    : path_(std::move(path)), daily_limit_(daily_limit), clock_(std::move(clock)) {
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

QuotaRecord QuotaStore::Load() {
  if (auto raw = ReadFile(path_)) {
    if (auto record = ParseRecord(*raw, daily_limit_)) {
      return *record;
    }
    KIOSK_LOG_WARN("Quota state invalid; starting a fresh day", {StringField("path", path_.string())});
  }

  auto record = Fresh();
  try {
    Persist(record);
  } catch (const kiosk::util::PersistenceError& e) {
    KIOSK_LOG_ERROR("Quota state not persisted; continuing in memory", {StringField("error", e.what())});
  }
  return record;
}

// ------------------------------------------------------------
// Checks and mutations
// ------------------------------------------------------------

void QuotaStore::EnsureToday(QuotaRecord& record) {
  const auto today = Today();
  if (record.date() == today) return;

  KIOSK_LOG_INFO("Quota reset for new day", {StringField("previous", record.date()), StringField("today", today)});
  record.set_date(today);
  record.set_shots_remaining(static_cast<int32_t>(daily_limit_));
  Persist(record);
}

bool QuotaStore::CanCapture(QuotaRecord& record) {
  EnsureToday(record);
  return record.shots_remaining() > 0;
}

void QuotaStore::Decrement(QuotaRecord& record) {
  record.set_shots_remaining(std::max(0, record.shots_remaining() - 1));
  Persist(record);
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

QuotaRecord QuotaStore::Fresh() const {
  QuotaRecord record;
  record.set_date(Today());
  record.set_shots_remaining(static_cast<int32_t>(daily_limit_));
  return record;
}

std::string QuotaStore::Today() const {
  return kiosk::util::LocalIsoDate(clock_());
}

/*
  Atomic write:
      write tmp → fsync → rename → fsync dir
*/
void QuotaStore::Persist(const QuotaRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.add_whitespace                = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw kiosk::util::PersistenceError("quota serialization failed: " + std::string(status.message()));
  }

  const auto tmp_path = std::filesystem::path(path_.string() + ".tmp");
  try {
    WriteDurably(tmp_path, json);
  } catch (const kiosk::util::PersistenceError& e) {
    KIOSK_LOG_ERROR("Quota write failed", {StringField("path", tmp_path.string()), IntField("shots_remaining", record.shots_remaining()), StringField("error", e.what())});
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    KIOSK_LOG_ERROR("Quota rename failed", {StringField("path", path_.string()), StringField("error", ec.message())});
    throw kiosk::util::PersistenceError("failed to replace " + path_.string() + ": " + ec.message());
  }

  // the rename itself lives in the directory entry
  auto dir = path_.parent_path();
  if (dir.empty()) dir = ".";
  const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0 || ::fsync(dir_fd) != 0) {
    const std::string error = std::strerror(errno);
    if (dir_fd >= 0) ::close(dir_fd);
    KIOSK_LOG_ERROR("Quota directory sync failed", {StringField("path", dir.string()), StringField("error", error)});
    throw kiosk::util::PersistenceError("failed to sync " + dir.string() + ": " + error);
  }
  ::close(dir_fd);
}

} // namespace kiosk::quota
