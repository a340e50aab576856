#include "ledger/storage/snapshot_store.hpp"
#include "ledger/observability/metrics.hpp"
#include "ledger/storage/atomic_file.hpp"

#include <system_error>

namespace ledger {
namespace storage {

namespace fs = std::filesystem;
using observability::getGlobalMetrics;
namespace metric = observability::metric;

SnapshotStore::SnapshotStore(fs::path data_dir) : data_dir_(std::move(data_dir)) {}

fs::path SnapshotStore::pathFor(const std::string& file_name) const {
  return data_dir_ / file_name;
}

bool SnapshotStore::saveDocument(const std::string& file_name, const nlohmann::json& doc) {
  std::string content;
  try {
    content = doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    content += '\n';
  } catch (const nlohmann::json::exception& e) {
    getGlobalMetrics().incrementCounter(metric::kSnapshotSaveFailures);
    LEDGER_LOG_ERROR("Failed to serialize " + file_name + ": " + e.what());
    return false;
  }
  return saveText(file_name, content);
}

bool SnapshotStore::saveText(const std::string& file_name, const std::string& content) {
  auto& metrics = getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, metric::kSnapshotSaveSeconds);

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!writeFileAtomically(pathFor(file_name), content, file_name)) {
    metrics.incrementCounter(metric::kSnapshotSaveFailures);
    LEDGER_LOG_ERROR("Snapshot save failed, previous " + file_name + " kept");
    return false;
  }
  metrics.incrementCounter(metric::kSnapshotSaves);
  return true;
}

bool SnapshotStore::setAside(const std::string& file_name) {
  const fs::path path = pathFor(file_name);
  fs::path aside = path;
  aside += ".corrupt";

  std::lock_guard<std::mutex> lock(write_mutex_);
  std::error_code ec;
  fs::rename(path, aside, ec);
  if (ec) {
    LEDGER_LOG_ERROR("Failed to set aside " + path.string() + ": " + ec.message());
    return false;
  }
  LEDGER_LOG_WARN("Unreadable snapshot kept as " + aside.string());
  return true;
}

LoadStatus SnapshotStore::loadDocument(const std::string& file_name, nlohmann::json& out,
                                       std::string& error) const {
  const fs::path path = pathFor(file_name);

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return LoadStatus::kMissing;
  }

  auto content = readFile(path);
  if (!content) {
    error = "unreadable file " + path.string();
    LEDGER_LOG_ERROR("Failed to read snapshot " + path.string());
    return LoadStatus::kCorrupt;
  }

  out = nlohmann::json::parse(*content, nullptr, false);
  if (out.is_discarded()) {
    error = "malformed JSON in " + path.string();
    LEDGER_LOG_ERROR("Snapshot " + path.string() + " is not valid JSON");
    return LoadStatus::kCorrupt;
  }
  return LoadStatus::kLoaded;
}

}  // namespace storage
}  // namespace ledger
