#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ingest {

// A row that could not be turned into a transaction record. Never reaches
// the ledger.
struct ParseError {
  std::uint64_t line{0};
  std::string message;
};

// Column positions of the four record fields within a row.
struct ColumnLayout {
  std::size_t type{0};
  std::size_t client{1};
  std::size_t tx{2};
  std::size_t amount{3};
};

struct RowParseResult {
  bool success{false};
  ledger::TransactionRecord record;
  std::string error;
};

// Splits one row on commas and trims ASCII whitespace around every field.
std::vector<std::string_view> split_fields(std::string_view line);

// Turns the fields of one row into a record, validating ids, amount presence
// and amount precision for the record kind.
RowParseResult parse_row(const std::vector<std::string_view>& fields, const ColumnLayout& layout);

// Lazily reads transaction records from delimited text. Malformed rows are
// counted, handed to the error handler and skipped.
class CsvReader {
 public:
  struct Config {
    bool has_headers{true};
  };

  struct Stats {
    std::uint64_t rows_read{0};
    std::uint64_t records_parsed{0};
    std::uint64_t malformed{0};
  };

  using ErrorHandler = std::function<void(const ParseError&)>;

  explicit CsvReader(std::istream& input);
  CsvReader(std::istream& input, Config config);

  void set_error_handler(ErrorHandler handler);

  // Fills `out` with the next well-formed record. Returns false at end of input.
  bool next(ledger::TransactionRecord& out);

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  [[nodiscard]] const ColumnLayout& layout() const noexcept { return layout_; }

 private:
  std::istream& input_;
  Config config_{};
  ColumnLayout layout_{};
  ErrorHandler error_handler_{};
  Stats stats_{};
  std::uint64_t line_number_{0};
  bool header_consumed_{false};
  std::string line_{};

  bool read_header();
  void report(std::string message);
};

}  // namespace ingest
}  // namespace paycore
