#pragma once

#include <cstdint>
#include <filesystem>

#include "internal/util/time.hpp"
#include "kiosk/v1.hpp"

namespace kiosk::quota {

/*
  Daily shot counter persisted as a single JSON file.

  The record is lazily rolled forward to today's local date before every
  check or mutation. Writes go to "<path>.tmp" and are renamed over the
  real file, so a crash never leaves a partial record behind.

  Mutating calls update the record in memory first; if the write then
  fails they throw util::PersistenceError and the caller keeps using the
  in-memory value.
*/
class QuotaStore {
 public:
  QuotaStore(std::filesystem::path path, uint32_t daily_limit, kiosk::util::ClockFn clock = kiosk::util::Now);

  // Absent or schema-invalid files yield a fresh record for today. A failed
  // write of that fresh record is logged, not thrown.
  kiosk::v1::QuotaRecord Load();

  void EnsureToday(kiosk::v1::QuotaRecord& record);
  bool CanCapture(kiosk::v1::QuotaRecord& record);
  void Decrement(kiosk::v1::QuotaRecord& record);

  uint32_t DailyLimit() const {
    return daily_limit_;
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  kiosk::v1::QuotaRecord Fresh() const;
  std::string            Today() const;
  void                   Persist(const kiosk::v1::QuotaRecord& record);

  std::filesystem::path path_;
  uint32_t              daily_limit_;
  kiosk::util::ClockFn  clock_;
};

} // namespace kiosk::quota
