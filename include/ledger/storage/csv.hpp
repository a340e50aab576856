#ifndef LEDGER_CSV_HPP_
#define LEDGER_CSV_HPP_

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger {
namespace storage {
namespace csv {

/**
 * Formats one CSV row terminated by "\n". Cells containing a comma,
 * quote, CR or LF are quoted with embedded quotes doubled (RFC 4180).
 */
std::string formatRow(const std::vector<std::string>& cells);

/**
 * Reads CSV records from a stream. Quoted cells may span lines.
 */
class Reader {
 public:
  explicit Reader(std::istream& in);

  /**
   * Reads the next record into `cells`. Returns false at end of input.
   * Blank lines are skipped.
   */
  bool next(std::vector<std::string>& cells);

  // 1-based line where the last returned record started
  size_t lineNumber() const { return record_line_; }

 private:
  std::istream& in_;
  size_t line_ = 1;
  size_t record_line_ = 0;
};

/**
 * Header-keyed view of a record. Missing columns read as "".
 */
class Row {
 public:
  Row(const std::unordered_map<std::string, size_t>& index,
      const std::vector<std::string>& cells)
      : index_(index), cells_(cells) {}

  const std::string& get(const std::string& column) const;

 private:
  const std::unordered_map<std::string, size_t>& index_;
  const std::vector<std::string>& cells_;
};

// Column name -> position, from a header record
std::unordered_map<std::string, size_t> indexHeader(const std::vector<std::string>& header);

}  // namespace csv
}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_CSV_HPP_
