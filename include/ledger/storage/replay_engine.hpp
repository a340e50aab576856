#ifndef LEDGER_REPLAY_ENGINE_HPP_
#define LEDGER_REPLAY_ENGINE_HPP_

#include "ledger/model/account.hpp"
#include "ledger/storage/activity_log.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Outcome counters of one replay pass.
 */
struct ReplayReport {
  size_t rows_read = 0;
  size_t applied = 0;
  size_t duplicates = 0;       // txnId already held by the account
  size_t unmatched = 0;        // no loaded account for the row
  size_t ignored_actions = 0;  // not a transaction-producing action
  size_t malformed = 0;        // missing or unparseable amount, balance or txnId
  bool log_readable = true;

  size_t skipped() const { return duplicates + unmatched + ignored_actions + malformed; }
};

/**
 * Brings loaded accounts up to date with the activity log.
 *
 * Rows are applied in file order. Each row is matched to an account by
 * account number, falling back to username for rows written without one.
 * A row whose txnId the account already holds is skipped, so replaying
 * the same log any number of times converges to the same state. Every
 * applied row overwrites the account balance with its resultingBalance:
 * the last row in the file for an account decides its balance.
 */
class ReplayEngine {
 public:
  ReplayEngine();
  explicit ReplayEngine(std::unordered_set<std::string> transaction_actions);

  // Actions replayed by default
  static const std::unordered_set<std::string>& defaultActions();

  bool isTransactionAction(const std::string& action) const;

  ReplayReport replay(std::vector<model::Account>& accounts, const ActivityLog& log) const;

 private:
  std::unordered_set<std::string> transaction_actions_;
};

}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_REPLAY_ENGINE_HPP_
