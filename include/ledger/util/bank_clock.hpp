#ifndef LEDGER_BANK_CLOCK_HPP_
#define LEDGER_BANK_CLOCK_HPP_

#include <chrono>
#include <mutex>
#include <string>

namespace ledger {
namespace util {

/**
 * Virtual wall clock for the banking simulation.
 * Follows the system clock until pinned with setNow(); advance() moves
 * the virtual time forward from wherever it currently is.
 */
class BankClock {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  BankClock() = default;

  // Non-copyable
  BankClock(const BankClock&) = delete;
  BankClock& operator=(const BankClock&) = delete;

  TimePoint now() const;

  void setNow(TimePoint when);
  void advance(std::chrono::seconds by);

  // Back to following the system clock
  void reset();

  /** Local time as "dd-mm-YYYY HH:MM:SS", the activity log timestamp format. */
  std::string formattedDateTime() const;

  /** Local date as "YYYYMMDD". */
  std::string compactDate() const;

  static std::string formatDateTime(TimePoint when);
  static std::string formatCompactDate(TimePoint when);

 private:
  mutable std::mutex mutex_;
  bool pinned_ = false;
  TimePoint pinned_time_{};
};

}  // namespace util
}  // namespace ledger

#endif  // LEDGER_BANK_CLOCK_HPP_
