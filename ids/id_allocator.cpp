#include "ledger/ids/id_allocator.hpp"
#include "ledger/errors.hpp"
#include "ledger/observability/logger.hpp"
#include "ledger/observability/metrics.hpp"
#include "ledger/storage/atomic_file.hpp"
#include "ledger/util/bank_clock.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <sstream>
#include <system_error>

namespace ledger {
namespace ids {

namespace fs = std::filesystem;
using observability::getGlobalMetrics;
using observability::LogLevel;
namespace metric = observability::metric;

namespace {

std::string systemDate() {
  return util::BankClock::formatCompactDate(std::chrono::system_clock::now());
}

uint64_t seedFromDevice() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

IdAllocator::IdAllocator(AllocatorOptions options)
    : IdAllocator(std::move(options), systemDate) {}

IdAllocator::IdAllocator(AllocatorOptions options, DateSource date_source)
    : options_(std::move(options)),
      date_source_(std::move(date_source)),
      rng_(seedFromDevice()) {
  if (!date_source_) date_source_ = systemDate;
}

void IdAllocator::setCandidateSource(CandidateSource source) {
  std::lock_guard<std::mutex> lock(mutex_);
  candidate_source_ = std::move(source);
}

bool IdAllocator::readSetLocked(std::unordered_set<std::string>& out) const {
  auto content = storage::readFile(options_.path);
  if (!content) {
    return false;
  }

  out.clear();
  if (options_.format == SetFormat::kJsonArray) {
    auto doc = nlohmann::json::parse(*content, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
      LEDGER_LOG_BUILDER(LogLevel::WARN, "Failed to load issued ids")
          .field("registry", options_.name)
          .field("path", options_.path.string());
      return false;
    }
    for (const auto& item : doc) {
      if (item.is_string()) out.insert(item.get<std::string>());
    }
    return true;
  }

  std::stringstream ss(*content);
  std::string line;
  while (std::getline(ss, line)) {
    line = trim(line);
    if (!line.empty()) out.insert(line);
  }
  return true;
}

void IdAllocator::loadLocked() {
  if (loaded_ && options_.reload == ReloadPolicy::kOnce) {
    return;
  }

  std::error_code ec;
  if (!fs::exists(options_.path, ec)) {
    // Nothing issued yet, or the file was removed; keep what we know
    loaded_ = true;
    return;
  }

  std::unordered_set<std::string> from_disk;
  if (readSetLocked(from_disk)) {
    issued_ = std::move(from_disk);
  } else if (!loaded_) {
    issued_.clear();
  }
  loaded_ = true;
}

bool IdAllocator::persistLocked() {
  // Sorted so the file is stable between runs
  std::set<std::string> ordered(issued_.begin(), issued_.end());

  std::string content;
  if (options_.format == SetFormat::kJsonArray) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto& id : ordered) doc.push_back(id);
    try {
      content = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
      LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to serialize id set")
          .field("registry", options_.name)
          .field("error", e.what());
      return false;
    }
    content += '\n';
  } else {
    for (const auto& id : ordered) {
      content += id;
      content += '\n';
    }
  }
  return storage::writeFileAtomically(options_.path, content, options_.name + " ids");
}

std::string IdAllocator::nextCandidateLocked() {
  if (candidate_source_) {
    return candidate_source_();
  }

  std::string candidate = options_.prefix;
  if (options_.date_stamped) {
    candidate += date_source_();
  }
  std::uniform_int_distribution<int> digit(0, 9);
  for (int i = 0; i < options_.random_digits; ++i) {
    candidate += static_cast<char>('0' + digit(rng_));
  }
  return candidate;
}

std::string IdAllocator::generate() {
  auto& metrics = getGlobalMetrics();
  std::lock_guard<std::mutex> lock(mutex_);
  loadLocked();

  for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
    std::string candidate = nextCandidateLocked();
    if (!issued_.insert(candidate).second) {
      metrics.incrementCounter(metric::kIdCollisions);
      continue;
    }

    if (!persistLocked()) {
      issued_.erase(candidate);
      throw IdPersistError("Failed to persist " + options_.name + " ID set to " +
                           options_.path.string());
    }
    metrics.incrementCounter(metric::kIdAllocations);
    return candidate;
  }

  LEDGER_LOG_BUILDER(LogLevel::FATAL, "Identifier space exhausted")
      .field("registry", options_.name)
      .field("attempts", options_.max_attempts)
      .field("issued", issued_.size());
  throw IdExhaustedError("Failed to generate unique " + options_.name + " ID after " +
                         std::to_string(options_.max_attempts) + " attempts.");
}

bool IdAllocator::contains(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  loadLocked();
  return issued_.count(id) > 0;
}

bool IdAllocator::reserve(const std::string& id) {
  return reserveAll({id}) == 1;
}

size_t IdAllocator::reserveAll(const std::vector<std::string>& ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  loadLocked();

  std::vector<std::string> added;
  for (const auto& id : ids) {
    if (!id.empty() && issued_.insert(id).second) {
      added.push_back(id);
    }
  }
  if (added.empty()) {
    return 0;
  }

  if (!persistLocked()) {
    for (const auto& id : added) issued_.erase(id);
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Failed to record existing ids")
        .field("registry", options_.name)
        .field("count", added.size());
    return 0;
  }
  return added.size();
}

size_t IdAllocator::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  loadLocked();
  return issued_.size();
}

AllocatorStats IdAllocator::stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  loadLocked();

  AllocatorStats stats;
  stats.total_ids = issued_.size();
  stats.file_path = options_.path.string();
  stats.prefix = options_.prefix;
  stats.id_length = options_.prefix.size() + (options_.date_stamped ? 8 : 0) +
                    static_cast<size_t>(options_.random_digits);
  return stats;
}

}  // namespace ids
}  // namespace ledger
