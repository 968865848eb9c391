#include "paycore/ingest/csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace paycore {
namespace ingest {

namespace {
constexpr std::size_t kNoColumn = std::numeric_limits<std::size_t>::max();

std::string_view trim(std::string_view text) {
  constexpr std::string_view kWhitespace = " \t\r\n";
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

// Spreadsheet exports often prefix the first line with a UTF-8 byte order mark.
void strip_bom(std::string& line) {
  constexpr std::string_view kBom = "\xEF\xBB\xBF";
  if (std::string_view{line}.substr(0, kBom.size()) == kBom) {
    line.erase(0, kBom.size());
  }
}

std::string lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<ledger::TransactionKind> parse_kind(std::string_view text) {
  const std::string name = lowercase(text);
  if (name == "deposit") {
    return ledger::TransactionKind::kDeposit;
  }
  if (name == "withdrawal") {
    return ledger::TransactionKind::kWithdrawal;
  }
  if (name == "dispute") {
    return ledger::TransactionKind::kDispute;
  }
  if (name == "resolve") {
    return ledger::TransactionKind::kResolve;
  }
  if (name == "chargeback") {
    return ledger::TransactionKind::kChargeback;
  }
  return std::nullopt;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  std::uint64_t value = 0;
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  if (text.empty()) {
    return std::nullopt;
  }
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end || value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}

std::string_view field_or_empty(const std::vector<std::string_view>& fields, std::size_t index) {
  return index < fields.size() ? fields[index] : std::string_view{};
}
}  // namespace

std::vector<std::string_view> split_fields(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  return fields;
}

RowParseResult parse_row(const std::vector<std::string_view>& fields, const ColumnLayout& layout) {
  RowParseResult result;

  const std::size_t required = std::max({layout.type, layout.client, layout.tx}) + 1;
  if (fields.size() < required) {
    result.error = "expected at least " + std::to_string(required) + " fields, got " + std::to_string(fields.size());
    return result;
  }

  const auto kind = parse_kind(fields[layout.type]);
  if (!kind) {
    result.error = "unknown transaction type '" + std::string(fields[layout.type]) + "'";
    return result;
  }

  const auto client = parse_unsigned<common::ClientId>(fields[layout.client]);
  if (!client) {
    result.error = "invalid client id '" + std::string(fields[layout.client]) + "'";
    return result;
  }

  const auto tx = parse_unsigned<common::TxId>(fields[layout.tx]);
  if (!tx) {
    result.error = "invalid tx id '" + std::string(fields[layout.tx]) + "'";
    return result;
  }

  const std::string_view amount_text = field_or_empty(fields, layout.amount);

  result.record.kind = *kind;
  result.record.client = *client;
  result.record.tx = *tx;

  if (ledger::carries_amount(*kind)) {
    if (amount_text.empty()) {
      result.error = std::string(ledger::to_string(*kind)) + " requires an amount";
      return result;
    }
    const auto amount = common::Amount::parse(amount_text);
    if (!amount) {
      result.error = "invalid amount '" + std::string(amount_text) + "' (at most " +
                     std::to_string(common::Amount::kFractionDigits) + " fractional digits)";
      return result;
    }
    if (amount->is_negative()) {
      result.error = "negative amount '" + std::string(amount_text) + "'";
      return result;
    }
    result.record.amount = *amount;
  } else if (!amount_text.empty()) {
    result.error = std::string(ledger::to_string(*kind)) + " must not carry an amount";
    return result;
  }

  result.success = true;
  return result;
}

CsvReader::CsvReader(std::istream& input) : CsvReader(input, Config{}) {}

CsvReader::CsvReader(std::istream& input, Config config) : input_(input), config_(config) {}

void CsvReader::set_error_handler(ErrorHandler handler) {
  error_handler_ = std::move(handler);
}

bool CsvReader::next(ledger::TransactionRecord& out) {
  if (config_.has_headers && !header_consumed_) {
    header_consumed_ = true;
    if (!read_header()) {
      return false;
    }
  }

  while (std::getline(input_, line_)) {
    if (++line_number_ == 1) {
      strip_bom(line_);
    }
    if (trim(line_).empty()) {
      continue;
    }
    ++stats_.rows_read;

    auto parsed = parse_row(split_fields(line_), layout_);
    if (!parsed.success) {
      report(std::move(parsed.error));
      continue;
    }

    ++stats_.records_parsed;
    out = parsed.record;
    return true;
  }

  if (input_.bad()) {
    throw std::runtime_error("I/O error while reading transactions at line " + std::to_string(line_number_));
  }
  return false;
}

bool CsvReader::read_header() {
  while (std::getline(input_, line_)) {
    if (++line_number_ == 1) {
      strip_bom(line_);
    }
    if (trim(line_).empty()) {
      continue;
    }

    ColumnLayout layout{.type = kNoColumn, .client = kNoColumn, .tx = kNoColumn, .amount = kNoColumn};
    const auto fields = split_fields(line_);
    for (std::size_t idx = 0; idx < fields.size(); ++idx) {
      const std::string name = lowercase(fields[idx]);
      if (name == "type") {
        layout.type = idx;
      } else if (name == "client") {
        layout.client = idx;
      } else if (name == "tx") {
        layout.tx = idx;
      } else if (name == "amount") {
        layout.amount = idx;
      }
    }

    if (layout.type == kNoColumn || layout.client == kNoColumn || layout.tx == kNoColumn) {
      throw std::runtime_error("header at line " + std::to_string(line_number_) +
                               " must name the type, client and tx columns");
    }
    layout_ = layout;
    return true;
  }

  if (input_.bad()) {
    throw std::runtime_error("I/O error while reading transaction header");
  }
  return false;
}

void CsvReader::report(std::string message) {
  ++stats_.malformed;
  if (error_handler_) {
    error_handler_(ParseError{.line = line_number_, .message = std::move(message)});
  }
}

}  // namespace ingest
}  // namespace paycore
