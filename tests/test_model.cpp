#include "ledger/errors.hpp"
#include "ledger/model/account.hpp"
#include "ledger/model/activity_record.hpp"
#include "ledger/model/customer.hpp"
#include "ledger/model/loan.hpp"
#include "ledger/model/transaction.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ledger;
using nlohmann::json;

TEST(MetadataTest, ParsesJsonObject) {
  auto metadata = model::parseMetadata(R"({"loanId":"LN1","emi":3})");
  ASSERT_EQ(metadata.size(), 2u);
  EXPECT_EQ(metadata["loanId"], "LN1");
  EXPECT_EQ(metadata["emi"], "3");
}

TEST(MetadataTest, ParsesLegacyKeyValueForm) {
  auto metadata = model::parseMetadata("category=Transport; merchant=Metro;junk;=x");
  ASSERT_EQ(metadata.size(), 2u);
  EXPECT_EQ(metadata["category"], "Transport");
  EXPECT_EQ(metadata["merchant"], "Metro");
}

TEST(MetadataTest, EmptyAndBrokenInputYieldEmptyMap) {
  EXPECT_TRUE(model::parseMetadata("").empty());
  EXPECT_TRUE(model::parseMetadata("   ").empty());
  EXPECT_TRUE(model::parseMetadata("{not json").empty());
  EXPECT_EQ(model::serializeMetadata({}), "");
  EXPECT_EQ(model::serializeMetadata({{"billId", "B7"}}), R"({"billId":"B7"})");
}

TEST(TransactionJsonTest, UsesCamelCaseKeysAndNullOptionals) {
  model::Transaction txn;
  txn.id = "FHIC0000000001";
  txn.type = model::txn_type::kDeposit;
  txn.amount = 500;
  txn.resulting_balance = 1500;
  txn.timestamp = "05-03-2024 10:15:00";
  txn.category = "Salary";

  json j = txn;
  EXPECT_EQ(j["resultingBalance"], 1500.0);
  EXPECT_TRUE(j["chequeId"].is_null());
  EXPECT_EQ(j["category"], "Salary");
  EXPECT_TRUE(j["metadata"].is_null());

  EXPECT_EQ(j.get<model::Transaction>(), txn);
}

TEST(TransactionJsonTest, MissingRequiredFieldIsSchemaError) {
  json j = {{"id", "FHIC1"}, {"type", "DEPOSIT"}, {"amount", 10}};
  EXPECT_THROW(j.get<model::Transaction>(), SchemaError);

  j["resultingBalance"] = "ten";
  EXPECT_THROW(j.get<model::Transaction>(), SchemaError);
}

TEST(TransactionJsonTest, AcceptsLegacyMetadataString) {
  json j = {{"id", "FHIC1"},        {"type", "EXPENSE"},
            {"amount", 40},         {"resultingBalance", 960},
            {"metadata", "note=bus"}};
  auto txn = j.get<model::Transaction>();
  EXPECT_EQ(txn.metadata.at("note"), "bus");
  EXPECT_EQ(txn.timestamp, "");
}

TEST(AccountJsonTest, KeepsForeignSectionsVerbatim) {
  auto account = ledger::test_support::makeAccount("asha", "562100000001", 1000);
  account.cards = json::array({json{{"cardNumber", "4111"}, {"status", "ACTIVE"}}});
  account.salary_profile = {{"employer", "Acme"}, {"monthly", 52000}};

  json j = account;
  auto back = j.get<model::Account>();
  EXPECT_EQ(back, account);
  EXPECT_EQ(back.cards[0]["status"], "ACTIVE");
}

TEST(AccountJsonTest, DefaultsOptionalFields) {
  json j = {{"customerId", "CUST1"}, {"username", "u"},       {"password", "p"},
            {"firstName", "F"},      {"lastName", "L"},       {"dob", "d"},
            {"gender", "M"},         {"accountType", "Savings"},
            {"accountNumber", "562100000002"}, {"balance", 10}};
  auto account = j.get<model::Account>();
  EXPECT_TRUE(account.transactions.empty());
  EXPECT_EQ(account.failed_attempts, 0);
  EXPECT_FALSE(account.locked);
  EXPECT_TRUE(account.cards.is_array());
  EXPECT_TRUE(account.salary_profile.is_null());

  j["transactions"] = "none";
  EXPECT_THROW(j.get<model::Account>(), SchemaError);
}

TEST(CustomerJsonTest, OptionalLoanFields) {
  model::Customer customer;
  customer.customer_id = "CUST12345678";
  customer.username = "asha";
  customer.password = "pw";
  customer.first_name = "Asha";
  customer.last_name = "Rao";
  customer.dob = "01-01-1990";
  customer.gender = "F";
  customer.phone_number = "9999999999";
  customer.email = "asha@example.com";
  customer.account_numbers = {"562100000001"};
  customer.cibil_score = 780;

  json j = customer;
  auto back = j.get<model::Customer>();
  EXPECT_EQ(back, customer);
  EXPECT_EQ(back.cibil_score.value_or(0), 780);
  EXPECT_FALSE(back.salary.has_value());
}

TEST(LoanJsonTest, SnakeCaseKeysAndActiveDefault) {
  json j = {{"loan_id", "LN1"},      {"customer_id", "CUST1"}, {"principal", 100000},
            {"interest_rate", 10.5}, {"tenure_months", 24}};
  auto loan = j.get<model::Loan>();
  EXPECT_EQ(loan.status, "Active");
  EXPECT_EQ(loan.emis_paid, 0);
  EXPECT_FALSE(loan.closure_date.has_value());

  json out = loan;
  EXPECT_TRUE(out.contains("tenure_months"));
  EXPECT_EQ(out.get<model::Loan>(), loan);
}

TEST(ActivityRecordTest, FromTransactionCarriesCategoryInMetadata) {
  auto account = ledger::test_support::makeAccount("asha", "562100000001", 1000);
  model::Transaction txn;
  txn.id = "FHIC0000000009";
  txn.type = model::txn_type::kExpense;
  txn.amount = 40;
  txn.resulting_balance = 960;
  txn.category = "Transport";
  txn.payment_method = "UPI";
  txn.cheque_id = "CHQ1";

  auto record = model::ActivityRecord::fromTransaction(account, txn, "ONLINE");
  EXPECT_EQ(record.account_number, "562100000001");
  EXPECT_EQ(record.cheque_id, "CHQ1");
  EXPECT_EQ(record.metadata.at("category"), "Transport");
  EXPECT_EQ(record.metadata.at("method"), "UPI");
  EXPECT_EQ(record.metadata.count("merchant"), 0u);

  auto cells = model::toCells(record);
  ASSERT_EQ(cells.size(), model::activityColumns().size());
  EXPECT_EQ(cells[4], "40");
  EXPECT_EQ(cells[6], "960");
}

TEST(AmountTest, FormatsShortestExactText) {
  EXPECT_EQ(model::formatAmount(1500), "1500");
  EXPECT_EQ(model::formatAmount(0.1), "0.1");
  EXPECT_EQ(model::formatAmount(-12.5), "-12.5");
  double tricky = 0.1 + 0.2;
  EXPECT_EQ(*model::parseAmount(model::formatAmount(tricky)), tricky);
}

TEST(AmountTest, StrictParse) {
  EXPECT_EQ(model::parseAmount(" 42.5 ").value_or(0), 42.5);
  EXPECT_FALSE(model::parseAmount("").has_value());
  EXPECT_FALSE(model::parseAmount("12abc").has_value());
  EXPECT_FALSE(model::parseAmount("nan").has_value());
  EXPECT_FALSE(model::parseAmount("inf").has_value());
}
