#ifndef LEDGER_LEDGER_STORE_HPP_
#define LEDGER_LEDGER_STORE_HPP_

#include "ledger/ids/id_registries.hpp"
#include "ledger/ledger_config.hpp"
#include "ledger/model/account.hpp"
#include "ledger/model/activity_record.hpp"
#include "ledger/model/customer.hpp"
#include "ledger/model/loan.hpp"
#include "ledger/storage/activity_log.hpp"
#include "ledger/storage/replay_engine.hpp"
#include "ledger/storage/snapshot_store.hpp"
#include "ledger/util/bank_clock.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

/**
 * What a collaborator knows about a transaction before it is recorded.
 * The store fills in the id and the timestamp.
 */
struct TransactionDraft {
  std::string type;
  double amount = 0.0;
  double resulting_balance = 0.0;
  std::string mode;  // transfer mode (NEFT, RTGS, ...), log only
  std::optional<std::string> cheque_id;
  std::optional<std::string> category;
  std::optional<std::string> merchant;
  std::optional<std::string> payment_method;
  model::Metadata metadata;
};

/**
 * Persistence facade used by the banking subsystems.
 *
 * Entity collections are snapshotted as whole JSON files; balance-affecting
 * events go to the append-only activity log as they happen, and
 * loadAccounts() replays that log over the last snapshot. Snapshot I/O
 * failures are logged and reported through return values; only identifier
 * exhaustion and an undurable transaction escape as exceptions.
 */
class LedgerStore {
 public:
  explicit LedgerStore(const LedgerConfig& config);

  // Non-copyable
  LedgerStore(const LedgerStore&) = delete;
  LedgerStore& operator=(const LedgerStore&) = delete;

  /**
   * Last account snapshot (or the flat CSV when the snapshot is missing or
   * corrupt) with the activity log replayed over it. A corrupt snapshot is
   * renamed to bank_data.json.corrupt before the fallback. Stored
   * transactions without an id get a fresh one from the transaction
   * registry.
   */
  std::vector<model::Account> loadAccounts();

  /** Last account snapshot as written, no CSV fallback and no replay. */
  std::vector<model::Account> loadAccountsWithoutReplay();

  /** Writes bank_data.json and accounts.csv. False if either failed. */
  bool saveAccounts(const std::vector<model::Account>& accounts);

  std::vector<model::Customer> loadCustomers();
  bool saveCustomers(const std::vector<model::Customer>& customers);

  std::vector<model::Loan> loadLoans();
  bool saveLoans(const std::vector<model::Loan>& loans);

  /** Durably appends one activity row. */
  bool appendActivity(const model::ActivityRecord& record);

  /**
   * Standard path for a balance-affecting event: allocates a transaction
   * id, stamps the time, appends the activity row and only then adds the
   * transaction to `account` and sets its balance.
   * Throws ActivityLogError if the row could not be written (the account
   * is left untouched) and IdAllocationError if no id could be issued.
   */
  model::Transaction recordTransaction(model::Account& account, const TransactionDraft& draft);

  ids::IdRegistries& ids() { return ids_; }
  util::BankClock& clock() { return clock_; }
  storage::ActivityLog& activityLog() { return activity_log_; }
  const LedgerConfig& config() const { return config_; }

  // Outcome of the replay done by the last loadAccounts()
  storage::ReplayReport lastReplayReport() const;

 private:
  std::vector<model::Account> loadAccountSnapshotLocked();
  void reserveLoadedIds(const std::vector<model::Account>& accounts);

  LedgerConfig config_;
  util::BankClock clock_;
  storage::SnapshotStore snapshots_;
  storage::ActivityLog activity_log_;
  storage::ReplayEngine replay_engine_;
  ids::IdRegistries ids_;

  storage::ReplayReport last_replay_;
  mutable std::mutex mutex_;
};

}  // namespace ledger

#endif  // LEDGER_LEDGER_STORE_HPP_
