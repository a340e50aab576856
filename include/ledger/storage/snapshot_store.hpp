#ifndef LEDGER_SNAPSHOT_STORE_HPP_
#define LEDGER_SNAPSHOT_STORE_HPP_

#include "ledger/errors.hpp"
#include "ledger/observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace storage {

enum class LoadStatus {
  kLoaded,
  kMissing,  // no file yet; an empty collection is the correct state
  kCorrupt   // file exists but could not be read, parsed or validated
};

template <typename T>
struct LoadResult {
  LoadStatus status = LoadStatus::kMissing;
  std::vector<T> items;
  std::string error;

  bool ok() const { return status == LoadStatus::kLoaded; }
};

/**
 * Whole-collection JSON snapshots kept in one data directory.
 *
 * A collection is a JSON array stored in a file named after it. Saves go
 * through writeFileAtomically(), so a crash mid-save leaves the previous
 * snapshot intact. Neither save() nor load() throws.
 */
class SnapshotStore {
 public:
  explicit SnapshotStore(std::filesystem::path data_dir);

  // Non-copyable
  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  const std::filesystem::path& dataDir() const { return data_dir_; }
  std::filesystem::path pathFor(const std::string& file_name) const;

  /**
   * Serializes `items` (via their to_json) and atomically replaces the file.
   * Returns false on any failure; the previous snapshot is left untouched.
   */
  template <typename T>
  bool save(const std::string& file_name, const std::vector<T>& items) {
    nlohmann::json doc;
    try {
      doc = items;
    } catch (const nlohmann::json::exception& e) {
      LEDGER_LOG_ERROR("Failed to serialize " + file_name + ": " + e.what());
      return false;
    }
    return saveDocument(file_name, doc);
  }

  /**
   * Reads the collection. A missing file yields kMissing with no items; a
   * file that does not parse, is not an array, or holds an item violating
   * the schema yields kCorrupt with no items.
   */
  template <typename T>
  LoadResult<T> load(const std::string& file_name) const {
    LoadResult<T> result;
    nlohmann::json doc;
    result.status = loadDocument(file_name, doc, result.error);
    if (result.status != LoadStatus::kLoaded) {
      return result;
    }

    try {
      if (!doc.is_array()) {
        throw SchemaError(file_name + ": expected a JSON array");
      }
      result.items.reserve(doc.size());
      for (const auto& item : doc) {
        result.items.push_back(item.template get<T>());
      }
    } catch (const SchemaError& e) {
      result = corrupt<T>(file_name, e.what());
    } catch (const nlohmann::json::exception& e) {
      result = corrupt<T>(file_name, e.what());
    }
    return result;
  }

  /** Writes a JSON document with the snapshot discipline. */
  bool saveDocument(const std::string& file_name, const nlohmann::json& doc);

  /** Writes raw text with the snapshot discipline. */
  bool saveText(const std::string& file_name, const std::string& content);

  /**
   * Renames an unreadable snapshot to `<file_name>.corrupt` so a later
   * save cannot overwrite the only copy. Replaces an older .corrupt file.
   */
  bool setAside(const std::string& file_name);

  LoadStatus loadDocument(const std::string& file_name, nlohmann::json& out,
                          std::string& error) const;

 private:
  template <typename T>
  static LoadResult<T> corrupt(const std::string& file_name, const std::string& error) {
    LEDGER_LOG_ERROR("Snapshot " + file_name + " failed validation: " + error);
    LoadResult<T> result;
    result.status = LoadStatus::kCorrupt;
    result.error = error;
    return result;
  }

  std::filesystem::path data_dir_;
  std::mutex write_mutex_;
};

}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_SNAPSHOT_STORE_HPP_
