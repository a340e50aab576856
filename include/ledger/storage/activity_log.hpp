#ifndef LEDGER_ACTIVITY_LOG_HPP_
#define LEDGER_ACTIVITY_LOG_HPP_

#include "ledger/model/activity_record.hpp"
#include "ledger/storage/csv.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Append-only CSV log of account activity (account_activity.csv).
 *
 * Every append writes one row and fsyncs before returning, so an event
 * survives a crash that happens before the next snapshot. Rows are never
 * updated or removed; corrections are new rows. One mutex serializes all
 * access to the file.
 */
class ActivityLog {
 public:
  // Visitor receives the header-keyed row; return false to stop early
  using RowVisitor = std::function<bool(const csv::Row& row, size_t line)>;

  explicit ActivityLog(std::filesystem::path path);

  // Non-copyable
  ActivityLog(const ActivityLog&) = delete;
  ActivityLog& operator=(const ActivityLog&) = delete;

  const std::filesystem::path& path() const { return path_; }

  /**
   * Appends one record. Creates the file with its header row on first use.
   * Returns false (and logs) if the row could not be made durable.
   */
  bool append(const model::ActivityRecord& record);

  /**
   * Streams rows oldest to newest. Returns false if the log exists but
   * could not be opened; a missing log is an empty log.
   */
  bool forEach(const RowVisitor& visitor) const;

  /**
   * All rows decoded into records. Unparseable numeric cells decode as
   * empty optionals.
   */
  std::vector<model::ActivityRecord> readAll() const;

 private:
  bool ensureHeaderLocked();

  std::filesystem::path path_;
  mutable std::mutex mutex_;
};

}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_ACTIVITY_LOG_HPP_
