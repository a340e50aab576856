#ifndef LEDGER_ACCOUNT_CSV_HPP_
#define LEDGER_ACCOUNT_CSV_HPP_

#include "ledger/model/account.hpp"

#include <istream>
#include <string>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Flat accounts.csv rendering: one row per account with the login and
 * balance fields only. Transactions are never written here.
 */
std::string formatAccountsCsv(const std::vector<model::Account>& accounts);

/**
 * Rebuilds minimal accounts from accounts.csv. Rows that fail to parse
 * (missing account number, bad balance, ...) are skipped and logged.
 */
std::vector<model::Account> parseAccountsCsv(std::istream& in);

}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_ACCOUNT_CSV_HPP_
