#include "ledger/storage/csv.hpp"

namespace ledger {
namespace storage {
namespace csv {

namespace {

bool needsQuoting(const std::string& cell) {
  return cell.find_first_of(",\"\r\n") != std::string::npos;
}

const std::string kEmpty;

}  // namespace

std::string formatRow(const std::vector<std::string>& cells) {
  std::string row;
  for (size_t i = 0; i < cells.size(); ++i) {
    if (i > 0) row += ',';
    const std::string& cell = cells[i];
    if (!needsQuoting(cell)) {
      row += cell;
      continue;
    }
    row += '"';
    for (char c : cell) {
      if (c == '"') row += '"';
      row += c;
    }
    row += '"';
  }
  row += '\n';
  return row;
}

Reader::Reader(std::istream& in) : in_(in) {}

bool Reader::next(std::vector<std::string>& cells) {
  for (;;) {
    cells.clear();
    if (in_.peek() == std::char_traits<char>::eof()) {
      return false;
    }

    record_line_ = line_;
    std::string cell;
    bool in_quotes = false;
    bool saw_content = false;
    char c;

    while (in_.get(c)) {
      if (in_quotes) {
        if (c == '"') {
          if (in_.peek() == '"') {
            in_.get(c);
            cell += '"';
          } else {
            in_quotes = false;
          }
        } else {
          if (c == '\n') ++line_;
          cell += c;
        }
        continue;
      }

      if (c == '"') {
        in_quotes = true;
        saw_content = true;
      } else if (c == ',') {
        cells.push_back(std::move(cell));
        cell.clear();
        saw_content = true;
      } else if (c == '\r') {
        // CRLF line endings; a bare CR inside a record is dropped
      } else if (c == '\n') {
        ++line_;
        break;
      } else {
        cell += c;
        saw_content = true;
      }
    }

    if (!saw_content && cell.empty()) {
      continue;  // blank line
    }
    cells.push_back(std::move(cell));
    return true;
  }
}

const std::string& Row::get(const std::string& column) const {
  auto it = index_.find(column);
  if (it == index_.end() || it->second >= cells_.size()) {
    return kEmpty;
  }
  return cells_[it->second];
}

std::unordered_map<std::string, size_t> indexHeader(const std::vector<std::string>& header) {
  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < header.size(); ++i) {
    std::string name = header[i];
    // Tolerate a UTF-8 byte order mark and padding around names
    if (i == 0 && name.compare(0, 3, "\xEF\xBB\xBF") == 0) {
      name.erase(0, 3);
    }
    auto begin = name.find_first_not_of(' ');
    auto end = name.find_last_not_of(' ');
    name = begin == std::string::npos ? "" : name.substr(begin, end - begin + 1);
    index.emplace(name, i);
  }
  return index;
}

}  // namespace csv
}  // namespace storage
}  // namespace ledger
