#include "ledger/errors.hpp"
#include "ledger/ledger_config.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/storage/atomic_file.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>

using namespace ledger;
using ledger::test_support::TempDir;
using ledger::test_support::makeAccount;
using ledger::test_support::readText;
using ledger::test_support::writeText;

namespace {

std::vector<std::string> sortedTxnIds(const std::vector<model::Account>& accounts) {
  std::vector<std::string> ids;
  for (const auto& account : accounts) {
    for (const auto& txn : account.transactions) ids.push_back(txn.id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

TransactionDraft draft(const std::string& type, double amount, double resulting_balance) {
  TransactionDraft d;
  d.type = type;
  d.amount = amount;
  d.resulting_balance = resulting_balance;
  return d;
}

std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour,
                                                int minute) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

}  // namespace

// Test fixture for the persistence facade
class LedgerStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.data_dir = dir_.path().string();
    store_ = std::make_unique<LedgerStore>(config_);
  }

  // Simulates a process restart over the same data directory
  void restart() { store_ = std::make_unique<LedgerStore>(config_); }

  TempDir dir_;
  LedgerConfig config_;
  std::unique_ptr<LedgerStore> store_;
};

TEST_F(LedgerStoreTest, EmptyDataDirectoryLoadsEmpty) {
  EXPECT_TRUE(store_->loadAccounts().empty());
  EXPECT_TRUE(store_->loadCustomers().empty());
  EXPECT_TRUE(store_->loadLoans().empty());
  EXPECT_EQ(store_->lastReplayReport().rows_read, 0u);
}

TEST_F(LedgerStoreTest, SaveWritesJsonAndFlatCsv) {
  ASSERT_TRUE(store_->saveAccounts({makeAccount("asha", "562100000001", 1000)}));
  EXPECT_TRUE(std::filesystem::exists(dir_ / "bank_data.json"));
  std::string csv = readText(dir_ / "accounts.csv");
  EXPECT_EQ(csv.rfind("username,password,firstName,lastName,dob,gender,accountType,"
                      "accountNumber,balance,failedAttempts,locked\n",
                      0),
            0u);
  EXPECT_NE(csv.find("asha,secret,Asha,Rao,01-01-1990,F,Savings,562100000001,1000,0,false"),
            std::string::npos);
}

TEST_F(LedgerStoreTest, RecordedTransactionsSurviveCrashBeforeSnapshot) {
  auto account = makeAccount("asha", "562100000001", 1000);
  ASSERT_TRUE(store_->saveAccounts({account}));

  auto t1 = store_->recordTransaction(account, draft(model::txn_type::kDeposit, 500, 1500));
  auto t2 = store_->recordTransaction(account, draft(model::txn_type::kWithdraw, 200, 1300));
  EXPECT_EQ(account.balance, 1300);
  ASSERT_EQ(account.transactions.size(), 2u);

  // No saveAccounts() after the events: the log alone carries them
  restart();
  auto loaded = store_->loadAccounts();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].balance, 1300);
  ASSERT_EQ(loaded[0].transactions.size(), 2u);
  EXPECT_EQ(loaded[0].transactions[0], t1);
  EXPECT_EQ(loaded[0].transactions[1], t2);
  EXPECT_EQ(store_->lastReplayReport().applied, 2u);
}

TEST_F(LedgerStoreTest, LoadIsIdempotentAcrossSaves) {
  auto account = makeAccount("asha", "562100000001", 1000);
  store_->recordTransaction(account, draft(model::txn_type::kDeposit, 500, 1500));
  ASSERT_TRUE(store_->saveAccounts({account}));
  store_->recordTransaction(account, draft(model::txn_type::kWithdraw, 200, 1300));

  auto first = store_->loadAccounts();
  ASSERT_TRUE(store_->saveAccounts(first));
  auto second = store_->loadAccounts();

  EXPECT_EQ(sortedTxnIds(first), sortedTxnIds(second));
  EXPECT_EQ(sortedTxnIds(second).size(), 2u);
  EXPECT_EQ(second[0].balance, 1300);
  EXPECT_EQ(store_->lastReplayReport().applied, 0u);
  EXPECT_EQ(store_->lastReplayReport().duplicates, 2u);
}

TEST_F(LedgerStoreTest, RecordTransactionStampsIdTimeAndLogRow) {
  store_->clock().setNow(localTime(2024, 3, 5, 14, 30));
  auto account = makeAccount("asha", "562100000001", 100);

  TransactionDraft d = draft(model::txn_type::kBillPayment, 40, 60);
  d.mode = "UPI";
  d.category = "Utilities";
  d.metadata = {{"billId", "B7"}};
  auto txn = store_->recordTransaction(account, d);

  EXPECT_EQ(txn.id.substr(0, 4), "FHIC");
  EXPECT_EQ(txn.timestamp, "05-03-2024 14:30:00");
  EXPECT_TRUE(store_->ids().transactionIds().contains(txn.id));

  auto rows = store_->activityLog().readAll();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].txn_id, txn.id);
  EXPECT_EQ(rows[0].mode, "UPI");
  EXPECT_EQ(rows[0].timestamp, "05-03-2024 14:30:00");
  EXPECT_EQ(rows[0].metadata.at("category"), "Utilities");
  EXPECT_EQ(rows[0].metadata.at("billId"), "B7");
}

TEST_F(LedgerStoreTest, MetadataCategoryKeysReplayIntoTheSameTransaction) {
  auto account = makeAccount("asha", "562100000001", 100);
  ASSERT_TRUE(store_->saveAccounts({account}));

  TransactionDraft d = draft(model::txn_type::kExpense, 40, 60);
  d.metadata = {{"category", "Food"}, {"merchant", "Cafe"}, {"method", "UPI"}, {"note", "x"}};
  auto lifted = store_->recordTransaction(account, d);
  EXPECT_EQ(lifted.category.value_or(""), "Food");
  EXPECT_EQ(lifted.merchant.value_or(""), "Cafe");
  EXPECT_EQ(lifted.payment_method.value_or(""), "UPI");
  EXPECT_EQ(lifted.metadata, (model::Metadata{{"note", "x"}}));

  // A typed field wins over a metadata key of the same name
  TransactionDraft typed = draft(model::txn_type::kExpense, 10, 50);
  typed.category = "Travel";
  typed.metadata = {{"category", "Food"}};
  auto kept = store_->recordTransaction(account, typed);
  EXPECT_EQ(kept.category.value_or(""), "Travel");
  EXPECT_TRUE(kept.metadata.empty());

  restart();
  auto loaded = store_->loadAccounts();
  ASSERT_EQ(loaded.size(), 1u);
  ASSERT_EQ(loaded[0].transactions.size(), 2u);
  EXPECT_EQ(loaded[0].transactions[0], lifted);
  EXPECT_EQ(loaded[0].transactions[1], kept);
}

TEST_F(LedgerStoreTest, UndurableTransactionLeavesAccountUntouched) {
  // A directory where the log should be makes every append fail
  std::filesystem::create_directories(dir_ / "account_activity.csv");
  auto account = makeAccount("asha", "562100000001", 100);

  EXPECT_THROW(store_->recordTransaction(account, draft(model::txn_type::kDeposit, 5, 105)),
               ActivityLogError);
  EXPECT_EQ(account.balance, 100);
  EXPECT_TRUE(account.transactions.empty());
}

TEST_F(LedgerStoreTest, FallsBackToFlatCsvWhenSnapshotIsCorrupt) {
  auto account = makeAccount("asha", "562100000001", 1000);
  ASSERT_TRUE(store_->saveAccounts({account}));
  writeText(dir_ / "bank_data.json", "[{\"username\":");

  auto loaded = store_->loadAccounts();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].account_number, "562100000001");
  EXPECT_EQ(loaded[0].balance, 1000);

  EXPECT_TRUE(store_->loadAccountsWithoutReplay().empty());
  EXPECT_FALSE(std::filesystem::exists(dir_ / "bank_data.json"));
  EXPECT_EQ(readText(dir_ / "bank_data.json.corrupt"), "[{\"username\":");

  // Saving the fallback does not touch the set-aside copy
  ASSERT_TRUE(store_->saveAccounts(loaded));
  EXPECT_EQ(readText(dir_ / "bank_data.json.corrupt"), "[{\"username\":");
}

TEST_F(LedgerStoreTest, StoredTransactionWithoutIdKeepsAccountIntact) {
  auto account = makeAccount("asha", "562100000001", 1500);
  account.cards = nlohmann::json::array({nlohmann::json{{"cardId", "C1"}}});
  model::Transaction txn;
  txn.id = "FHIC0000000001";
  txn.type = model::txn_type::kDeposit;
  txn.amount = 500;
  txn.resulting_balance = 1500;
  account.transactions.push_back(txn);
  ASSERT_TRUE(store_->saveAccounts({account}));

  auto doc = nlohmann::json::parse(readText(dir_ / "bank_data.json"));
  doc[0]["transactions"][0].erase("id");
  writeText(dir_ / "bank_data.json", doc.dump(2));

  restart();
  auto loaded = store_->loadAccounts();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].cards, account.cards);
  ASSERT_EQ(loaded[0].transactions.size(), 1u);
  const std::string& issued = loaded[0].transactions[0].id;
  EXPECT_EQ(issued.substr(0, 4), "FHIC");
  EXPECT_NE(issued, "FHIC0000000001");
  EXPECT_TRUE(store_->ids().transactionIds().contains(issued));
  EXPECT_EQ(loaded[0].transactions[0].amount, 500);

  ASSERT_TRUE(store_->saveAccounts(loaded));
  auto saved = nlohmann::json::parse(readText(dir_ / "bank_data.json"));
  EXPECT_EQ(saved[0]["cards"], account.cards);
  EXPECT_EQ(saved[0]["transactions"][0]["id"], issued);
  EXPECT_FALSE(std::filesystem::exists(dir_ / "bank_data.json.corrupt"));
}

TEST_F(LedgerStoreTest, LogRowWithInvalidUtf8IsSkippedOnLoad) {
  ASSERT_TRUE(store_->saveAccounts({makeAccount("u", "562100000001", 1000)}));
  writeText(dir_ / "account_activity.csv",
            "timestamp,username,accountNumber,action,amount,mode,resultingBalance,txnId,"
            "chequeId,metadata\n"
            "t,u,562100000001,DEPOSIT,500,,1500,FHIC\xff\xfe,,\n");

  restart();
  std::vector<model::Account> loaded;
  ASSERT_NO_THROW(loaded = store_->loadAccounts());
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].balance, 1000);
  EXPECT_TRUE(loaded[0].transactions.empty());
  EXPECT_EQ(store_->lastReplayReport().malformed, 1u);
  EXPECT_EQ(store_->lastReplayReport().applied, 0u);

  EXPECT_TRUE(store_->saveAccounts(loaded));
  auto txn = store_->recordTransaction(loaded[0], draft(model::txn_type::kDeposit, 5, 1005));
  EXPECT_TRUE(store_->ids().transactionIds().contains(txn.id));
}

TEST_F(LedgerStoreTest, SnapshotSaveReplacesInvalidUtf8) {
  auto account = makeAccount("asha", "562100000001", 10);
  account.first_name = "Ash\xff";
  ASSERT_TRUE(store_->saveAccounts({account}));

  auto loaded = store_->loadAccountsWithoutReplay();
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].first_name, "Ash\xef\xbf\xbd");
}

TEST_F(LedgerStoreTest, CorruptCustomersLoadEmpty) {
  writeText(dir_ / "customers.json", "not json at all");
  EXPECT_TRUE(store_->loadCustomers().empty());
}

TEST_F(LedgerStoreTest, LoadReservesExistingIdentifiers) {
  auto account = makeAccount("asha", "562155555555", 10);
  model::Transaction old;
  old.id = "FHIC9999999999";
  old.type = model::txn_type::kDeposit;
  old.amount = 10;
  old.resulting_balance = 10;
  account.transactions.push_back(old);
  ASSERT_TRUE(store_->saveAccounts({account, makeAccount("legacy", "ACC-1", 0)}));

  model::Customer customer;
  customer.customer_id = "CUST55555555";
  customer.username = "asha";
  customer.account_numbers = {"562155555555"};
  ASSERT_TRUE(store_->saveCustomers({customer}));

  restart();
  store_->loadAccounts();
  store_->loadCustomers();

  EXPECT_TRUE(store_->ids().accountNumbers().contains("562155555555"));
  EXPECT_FALSE(store_->ids().accountNumbers().contains("ACC-1"));
  EXPECT_TRUE(store_->ids().transactionIds().contains("FHIC9999999999"));
  EXPECT_TRUE(store_->ids().customerIds().contains("CUST55555555"));
}

TEST_F(LedgerStoreTest, CustomersAndLoansRoundTrip) {
  model::Customer customer;
  customer.customer_id = "CUST00000042";
  customer.username = "ravi";
  customer.account_numbers = {"562100000001", "562100000002"};
  customer.salary = 85000;

  model::Loan loan;
  loan.loan_id = "LN42";
  loan.customer_id = customer.customer_id;
  loan.principal = 250000;
  loan.interest_rate = 11;
  loan.tenure_months = 36;
  loan.start_date = "2024-03-05";

  ASSERT_TRUE(store_->saveCustomers({customer}));
  ASSERT_TRUE(store_->saveLoans({loan}));

  restart();
  auto customers = store_->loadCustomers();
  auto loans = store_->loadLoans();
  ASSERT_EQ(customers.size(), 1u);
  ASSERT_EQ(loans.size(), 1u);
  EXPECT_EQ(customers[0], customer);
  EXPECT_EQ(loans[0], loan);
}

TEST_F(LedgerStoreTest, NachIdsUseTheStoreClockDate) {
  store_->clock().setNow(localTime(2024, 12, 31, 23, 0));
  EXPECT_EQ(store_->ids().nachIds().generate().substr(0, 12), "NACH20241231");
}

TEST(LedgerConfigTest, ReadsOverridesAndKeepsDefaults) {
  TempDir dir;
  writeText(dir / "ledger.json",
            R"({"data_dir": "/var/lib/bank", "activity_log": "activity.csv", "extra": 1})");

  auto config = LedgerConfig::fromJsonFile(dir / "ledger.json");
  EXPECT_EQ(config.data_dir, "/var/lib/bank");
  EXPECT_EQ(config.activity_log, "activity.csv");
  EXPECT_EQ(config.accounts_json, "bank_data.json");
  EXPECT_EQ(config.pathOf(config.activity_log),
            std::filesystem::path("/var/lib/bank/activity.csv"));
}

TEST(LedgerConfigTest, RejectsBadFiles) {
  TempDir dir;
  EXPECT_THROW(LedgerConfig::fromJsonFile(dir / "missing.json"), std::runtime_error);

  writeText(dir / "array.json", "[1, 2]");
  EXPECT_THROW(LedgerConfig::fromJsonFile(dir / "array.json"), std::runtime_error);

  writeText(dir / "typed.json", R"({"log_level": 3})");
  EXPECT_THROW(LedgerConfig::fromJsonFile(dir / "typed.json"), std::runtime_error);
}
