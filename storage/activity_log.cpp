#include "ledger/storage/activity_log.hpp"
#include "ledger/observability/logger.hpp"
#include "ledger/observability/metrics.hpp"
#include "ledger/storage/atomic_file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>

namespace ledger {
namespace storage {

namespace fs = std::filesystem;
using observability::getGlobalMetrics;
using observability::LogLevel;
namespace metric = observability::metric;

namespace {

bool writeAll(int fd, const std::string& data) {
  const char* p = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = ::write(fd, p, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += n;
    remaining -= static_cast<size_t>(n);
  }
  return true;
}

// True when the file is non-empty and its last byte is not a newline,
// i.e. a previous writer died mid-row.
bool endsWithPartialRow(int fd) {
  struct stat st;
  if (::fstat(fd, &st) != 0 || st.st_size == 0) {
    return false;
  }
  char last = '\n';
  if (::pread(fd, &last, 1, st.st_size - 1) != 1) {
    return false;
  }
  return last != '\n';
}

}  // namespace

ActivityLog::ActivityLog(fs::path path) : path_(std::move(path)) {}

bool ActivityLog::ensureHeaderLocked() {
  std::error_code ec;
  auto size = fs::file_size(path_, ec);
  if (!ec && size > 0) {
    return true;
  }
  if (!ensureParentDirectory(path_)) {
    return false;
  }

  int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to create activity log")
        .field("path", path_.string())
        .field("error", std::strerror(errno));
    return false;
  }
  bool ok = writeAll(fd, csv::formatRow(model::activityColumns())) && ::fsync(fd) == 0;
  ::close(fd);
  if (!ok) {
    LEDGER_LOG_ERROR("Failed to write activity log header to " + path_.string());
  }
  return ok;
}

bool ActivityLog::append(const model::ActivityRecord& record) {
  auto& metrics = getGlobalMetrics();
  std::lock_guard<std::mutex> lock(mutex_);

  if (!ensureHeaderLocked()) {
    metrics.incrementCounter(metric::kActivityAppendFailures);
    return false;
  }

  int fd = ::open(path_.c_str(), O_RDWR | O_APPEND | O_CLOEXEC);
  if (fd < 0) {
    metrics.incrementCounter(metric::kActivityAppendFailures);
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to open activity log")
        .field("path", path_.string())
        .field("error", std::strerror(errno));
    return false;
  }

  std::string row = csv::formatRow(model::toCells(record));
  if (endsWithPartialRow(fd)) {
    LEDGER_LOG_WARN("Activity log ends with a partial row, terminating it");
    row.insert(row.begin(), '\n');
  }

  bool ok = writeAll(fd, row) && ::fsync(fd) == 0;
  int saved_errno = errno;
  if (::close(fd) != 0 && ok) {
    ok = false;
    saved_errno = errno;
  }

  if (!ok) {
    metrics.incrementCounter(metric::kActivityAppendFailures);
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to append activity row")
        .field("action", record.action)
        .field("txn_id", record.txn_id)
        .field("error", std::strerror(saved_errno));
    return false;
  }

  metrics.incrementCounter(metric::kActivityAppends);
  return true;
}

bool ActivityLog::forEach(const RowVisitor& visitor) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return true;
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    LEDGER_LOG_ERROR("Failed to open activity log " + path_.string());
    return false;
  }

  csv::Reader reader(in);
  std::vector<std::string> cells;
  if (!reader.next(cells)) {
    return true;
  }
  const auto index = csv::indexHeader(cells);

  while (reader.next(cells)) {
    csv::Row row(index, cells);
    if (!visitor(row, reader.lineNumber())) {
      break;
    }
  }
  return true;
}

std::vector<model::ActivityRecord> ActivityLog::readAll() const {
  std::vector<model::ActivityRecord> records;
  forEach([&records](const csv::Row& row, size_t) {
    model::ActivityRecord record;
    record.timestamp = row.get("timestamp");
    record.username = row.get("username");
    record.account_number = row.get("accountNumber");
    record.action = row.get("action");
    record.amount = model::parseAmount(row.get("amount"));
    record.mode = row.get("mode");
    record.resulting_balance = model::parseAmount(row.get("resultingBalance"));
    record.txn_id = row.get("txnId");
    record.cheque_id = row.get("chequeId");
    record.metadata = model::parseMetadata(row.get("metadata"));
    records.push_back(std::move(record));
    return true;
  });
  return records;
}

}  // namespace storage
}  // namespace ledger
