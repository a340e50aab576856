#ifndef LEDGER_ID_ALLOCATOR_HPP_
#define LEDGER_ID_ALLOCATOR_HPP_

#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace ledger {
namespace ids {

/**
 * When the persisted set is read from disk.
 */
enum class ReloadPolicy {
  kOnce,      // on first use; later edits to the file are not seen
  kEveryCall  // before every operation, so external edits are honoured
};

/**
 * On-disk layout of the issued-id set.
 */
enum class SetFormat {
  kLines,     // one id per line
  kJsonArray  // JSON array of strings
};

struct AllocatorOptions {
  std::string name;  // used in log lines and error messages
  std::filesystem::path path;
  SetFormat format = SetFormat::kLines;
  ReloadPolicy reload = ReloadPolicy::kOnce;
  std::string prefix;
  bool date_stamped = false;  // prefix is followed by the YYYYMMDD date
  int random_digits = 8;
  int max_attempts = 1000;
};

struct AllocatorStats {
  size_t total_ids = 0;
  std::string file_path;
  std::string prefix;
  size_t id_length = 0;
};

/**
 * Issues identifiers that are unique against a persisted "already issued"
 * set. A candidate is the prefix (plus the date for date-stamped
 * registries) followed by random digits; it is accepted only if absent
 * from the set, and the grown set is written to disk before the id is
 * returned. Membership, not a counter, guarantees uniqueness.
 *
 * All operations take the allocator's own mutex.
 */
class IdAllocator {
 public:
  // Produces a full candidate id; replaces the random generator
  using CandidateSource = std::function<std::string()>;
  // Returns the date stamp ("YYYYMMDD") for date-stamped registries
  using DateSource = std::function<std::string()>;

  explicit IdAllocator(AllocatorOptions options);
  IdAllocator(AllocatorOptions options, DateSource date_source);

  // Non-copyable
  IdAllocator(const IdAllocator&) = delete;
  IdAllocator& operator=(const IdAllocator&) = delete;

  /**
   * Returns a fresh id, already recorded on disk.
   * Throws IdExhaustedError when every attempt collides, IdPersistError
   * when the updated set cannot be written.
   */
  std::string generate();

  bool contains(const std::string& id);

  /**
   * Records an id that was issued elsewhere (e.g. found in a snapshot).
   * Returns false if it was already known or could not be persisted.
   */
  bool reserve(const std::string& id);

  /**
   * Records several ids with a single write. Returns how many were new.
   */
  size_t reserveAll(const std::vector<std::string>& ids);

  size_t size();
  AllocatorStats stats();

  const AllocatorOptions& options() const { return options_; }

  void setCandidateSource(CandidateSource source);

 private:
  void loadLocked();
  bool readSetLocked(std::unordered_set<std::string>& out) const;
  bool persistLocked();
  std::string nextCandidateLocked();

  AllocatorOptions options_;
  DateSource date_source_;
  CandidateSource candidate_source_;
  std::unordered_set<std::string> issued_;
  bool loaded_ = false;
  std::mt19937_64 rng_;
  std::mutex mutex_;
};

}  // namespace ids
}  // namespace ledger

#endif  // LEDGER_ID_ALLOCATOR_HPP_
