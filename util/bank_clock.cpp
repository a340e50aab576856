#include "ledger/util/bank_clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ledger {
namespace util {

namespace {

std::string formatLocal(BankClock::TimePoint when, const char* pattern) {
  auto time_t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&time_t, &local);

  std::stringstream ss;
  ss << std::put_time(&local, pattern);
  return ss.str();
}

}  // namespace

BankClock::TimePoint BankClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pinned_ ? pinned_time_ : std::chrono::system_clock::now();
}

void BankClock::setNow(TimePoint when) {
  std::lock_guard<std::mutex> lock(mutex_);
  pinned_ = true;
  pinned_time_ = when;
}

void BankClock::advance(std::chrono::seconds by) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pinned_) {
    pinned_time_ = std::chrono::system_clock::now();
    pinned_ = true;
  }
  pinned_time_ += by;
}

void BankClock::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  pinned_ = false;
}

std::string BankClock::formattedDateTime() const {
  return formatDateTime(now());
}

std::string BankClock::compactDate() const {
  return formatCompactDate(now());
}

std::string BankClock::formatDateTime(TimePoint when) {
  return formatLocal(when, "%d-%m-%Y %H:%M:%S");
}

std::string BankClock::formatCompactDate(TimePoint when) {
  return formatLocal(when, "%Y%m%d");
}

}  // namespace util
}  // namespace ledger
