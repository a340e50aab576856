#include "ledger/observability/metrics.hpp"
#include "ledger/storage/activity_log.hpp"
#include "ledger/storage/replay_engine.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <unordered_set>
#include <vector>

using namespace ledger;
using ledger::test_support::TempDir;
using ledger::test_support::makeAccount;
using ledger::test_support::readText;
using ledger::test_support::writeText;

namespace {

model::ActivityRecord row(const std::string& account_number, const std::string& action,
                          double amount, double balance, const std::string& txn_id) {
  model::ActivityRecord record;
  record.timestamp = "05-03-2024 10:00:00";
  record.username = "asha";
  record.account_number = account_number;
  record.action = action;
  record.amount = amount;
  record.resulting_balance = balance;
  record.txn_id = txn_id;
  return record;
}

const std::string kHeader =
    "timestamp,username,accountNumber,action,amount,mode,resultingBalance,txnId,chequeId,"
    "metadata\n";

}  // namespace

// Test fixture for activity log and replay tests
class ActivityLogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    log_ = std::make_unique<storage::ActivityLog>(dir_ / "account_activity.csv");
  }

  TempDir dir_;
  std::unique_ptr<storage::ActivityLog> log_;
  storage::ReplayEngine engine_;
};

TEST_F(ActivityLogTest, FirstAppendWritesHeader) {
  ASSERT_TRUE(log_->append(row("562100000001", "DEPOSIT", 500, 1500, "T1")));
  std::string content = readText(log_->path());
  EXPECT_EQ(content.rfind(kHeader, 0), 0u);
  EXPECT_EQ(content.substr(kHeader.size()),
            "05-03-2024 10:00:00,asha,562100000001,DEPOSIT,500,,1500,T1,,\n");
}

TEST_F(ActivityLogTest, MissingLogReadsEmpty) {
  size_t rows = 0;
  EXPECT_TRUE(log_->forEach([&rows](const storage::csv::Row&, size_t) {
    ++rows;
    return true;
  }));
  EXPECT_EQ(rows, 0u);
  EXPECT_TRUE(log_->readAll().empty());
}

TEST_F(ActivityLogTest, RoundTripsNonMonetaryAndQuotedRows) {
  model::ActivityRecord created;
  created.timestamp = "05-03-2024 09:00:00";
  created.username = "asha";
  created.account_number = "562100000001";
  created.action = "ACCOUNT_CREATED";
  created.metadata = {{"note", "opened, with \"care\""}};
  ASSERT_TRUE(log_->append(created));
  ASSERT_TRUE(log_->append(row("562100000001", "DEPOSIT", 0.1, 0.1, "T1")));

  auto records = log_->readAll();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_FALSE(records[0].amount.has_value());
  EXPECT_FALSE(records[0].resulting_balance.has_value());
  EXPECT_EQ(records[0].metadata.at("note"), "opened, with \"care\"");
  EXPECT_EQ(records[1].amount.value_or(0), 0.1);
  EXPECT_EQ(records[1].txn_id, "T1");
}

TEST_F(ActivityLogTest, TerminatesPartialTrailingRow) {
  writeText(log_->path(), kHeader + "05-03-2024 10:00:00,asha,5621000000");
  ASSERT_TRUE(log_->append(row("562100000001", "DEPOSIT", 500, 1500, "T1")));

  auto records = log_->readAll();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1].txn_id, "T1");
  EXPECT_EQ(records[1].resulting_balance.value_or(0), 1500);
}

TEST_F(ActivityLogTest, ConcurrentAppendsKeepRowsWhole) {
  const int kThreads = 4;
  const int kPerThread = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        std::string id = "T" + std::to_string(t) + "_" + std::to_string(i);
        EXPECT_TRUE(log_->append(row("562100000001", "DEPOSIT", 1, i + 1, id)));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto records = log_->readAll();
  ASSERT_EQ(records.size(), static_cast<size_t>(kThreads * kPerThread));
  for (const auto& record : records) {
    EXPECT_EQ(record.account_number, "562100000001");
    EXPECT_TRUE(record.amount.has_value());
  }
}

TEST_F(ActivityLogTest, ReplayAppliesRowsInFileOrder) {
  std::vector<model::Account> accounts = {makeAccount("asha", "562100000001", 1000)};
  ASSERT_TRUE(log_->append(row("562100000001", "DEPOSIT", 500, 1500, "T1")));
  ASSERT_TRUE(log_->append(row("562100000001", "WITHDRAW", 200, 1300, "T2")));

  auto report = engine_.replay(accounts, *log_);
  EXPECT_EQ(report.applied, 2u);
  EXPECT_EQ(accounts[0].balance, 1300);
  ASSERT_EQ(accounts[0].transactions.size(), 2u);
  EXPECT_EQ(accounts[0].transactions[0].id, "T1");
  EXPECT_EQ(accounts[0].transactions[1].id, "T2");
  EXPECT_EQ(accounts[0].transactions[1].type, "WITHDRAW");

  // Second pass over the same log changes nothing
  auto again = engine_.replay(accounts, *log_);
  EXPECT_EQ(again.applied, 0u);
  EXPECT_EQ(again.duplicates, 2u);
  EXPECT_EQ(accounts[0].balance, 1300);
  EXPECT_EQ(accounts[0].transactions.size(), 2u);
}

TEST_F(ActivityLogTest, LastRowDecidesBalance) {
  std::vector<model::Account> accounts = {makeAccount("asha", "562100000001", 0)};
  ASSERT_TRUE(log_->append(row("562100000001", "WITHDRAW", 10, 90, "T2")));
  ASSERT_TRUE(log_->append(row("562100000001", "DEPOSIT", 100, 100, "T1")));

  engine_.replay(accounts, *log_);
  EXPECT_EQ(accounts[0].balance, 100);
  EXPECT_EQ(accounts[0].transactions.back().id, "T1");
}

TEST_F(ActivityLogTest, ReplaySkipsWhatItCannotApply) {
  std::vector<model::Account> accounts = {makeAccount("asha", "562100000001", 1000)};
  model::Transaction existing;
  existing.id = "T0";
  existing.type = "DEPOSIT";
  existing.amount = 1000;
  existing.resulting_balance = 1000;
  accounts[0].transactions.push_back(existing);

  writeText(log_->path(),
            kHeader +
                "t,asha,562100000001,DEPOSIT,1000,,1000,T0,,\n"         // already held
                "t,ghost,999,DEPOSIT,5,,5,T9,,\n"                        // no account
                "t,asha,562100000001,LOGIN,,,,,,\n"                      // not a transaction
                "t,asha,562100000001,DEPOSIT,abc,,1005,T3,,\n"           // bad amount
                "t,asha,562100000001,DEPOSIT,5,,1005,,,\n"               // no txnId
                "t,asha,562100000001,EXPENSE,40,,960,T4,,\"category=Food;merchant=Cafe\"\n");

  auto report = engine_.replay(accounts, *log_);
  EXPECT_EQ(report.rows_read, 6u);
  EXPECT_EQ(report.duplicates, 1u);
  EXPECT_EQ(report.unmatched, 1u);
  EXPECT_EQ(report.ignored_actions, 1u);
  EXPECT_EQ(report.malformed, 2u);
  EXPECT_EQ(report.applied, 1u);
  EXPECT_EQ(report.skipped(), 5u);

  EXPECT_EQ(accounts[0].balance, 960);
  ASSERT_EQ(accounts[0].transactions.size(), 2u);
  const auto& expense = accounts[0].transactions[1];
  EXPECT_EQ(expense.category.value_or(""), "Food");
  EXPECT_EQ(expense.merchant.value_or(""), "Cafe");
  EXPECT_TRUE(expense.metadata.empty());
}

TEST_F(ActivityLogTest, ReplaySkipsRowsWithInvalidUtf8) {
  std::vector<model::Account> accounts = {makeAccount("asha", "562100000001", 1000)};
  writeText(log_->path(),
            kHeader +
                "t,asha,562100000001,DEPOSIT,500,,1500,FHIC\xff\xfe,,\n"
                "t,asha,562100000001,DEPOSIT,5,,1505,T2,CHQ\xc3,\n"
                "\xed\xa0\x80,asha,562100000001,DEPOSIT,5,,1505,T3,,\n"
                "05-03-2024 10:00:00,asha,562100000001,DEPOSIT,7,,1007,T4,,"
                "\"{\"\"note\"\":\"\"caf\xc3\xa9\"\"}\"\n");

  auto report = engine_.replay(accounts, *log_);
  EXPECT_EQ(report.rows_read, 4u);
  EXPECT_EQ(report.malformed, 3u);
  EXPECT_EQ(report.applied, 1u);

  ASSERT_EQ(accounts[0].transactions.size(), 1u);
  EXPECT_EQ(accounts[0].transactions[0].id, "T4");
  EXPECT_EQ(accounts[0].transactions[0].metadata.at("note"), "caf\xc3\xa9");
  EXPECT_EQ(accounts[0].balance, 1007);
}

TEST_F(ActivityLogTest, ReplayFallsBackToUsername) {
  std::vector<model::Account> accounts = {makeAccount("asha", "562100000001", 0)};
  writeText(log_->path(), kHeader + "t,asha,,SALARY_CREDIT,50000,,50000,T1,,\n");

  auto report = engine_.replay(accounts, *log_);
  EXPECT_EQ(report.applied, 1u);
  EXPECT_EQ(accounts[0].balance, 50000);
}

TEST_F(ActivityLogTest, InjectedActionSetNarrowsReplay) {
  storage::ReplayEngine deposits_only(std::unordered_set<std::string>{model::txn_type::kDeposit});
  EXPECT_TRUE(deposits_only.isTransactionAction("DEPOSIT"));
  EXPECT_FALSE(deposits_only.isTransactionAction("WITHDRAW"));
  EXPECT_TRUE(engine_.isTransactionAction("LOAN_EMI"));
  EXPECT_FALSE(engine_.isTransactionAction("CARD_CLOSED"));

  std::vector<model::Account> accounts = {makeAccount("asha", "562100000001", 1000)};
  ASSERT_TRUE(log_->append(row("562100000001", "WITHDRAW", 200, 800, "T1")));
  auto report = deposits_only.replay(accounts, *log_);
  EXPECT_EQ(report.ignored_actions, 1u);
  EXPECT_EQ(accounts[0].balance, 1000);
}

TEST_F(ActivityLogTest, ReplayRecordsMetrics) {
  auto& metrics = observability::getGlobalMetrics();
  double applied = metrics.counterValue(observability::metric::kReplayRowsApplied);

  std::vector<model::Account> accounts = {makeAccount("asha", "562100000001", 1000)};
  ASSERT_TRUE(log_->append(row("562100000001", "DEPOSIT", 1, 1001, "T1")));
  engine_.replay(accounts, *log_);

  EXPECT_EQ(metrics.counterValue(observability::metric::kReplayRowsApplied), applied + 1);
}
