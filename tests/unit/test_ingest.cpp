#include "test_ingest.hpp"

#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "paycore/ingest/csv_reader.hpp"

namespace paycore::tests {

namespace {

std::vector<ledger::TransactionRecord> read_all(ingest::CsvReader& reader) {
  std::vector<ledger::TransactionRecord> records;
  ledger::TransactionRecord record;
  while (reader.next(record)) {
    records.push_back(record);
  }
  return records;
}

}  // namespace

void test_csv_reader_records() {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\n"
      "deposit,    2,  2,    2.0\n"
      "\n"
      "withdrawal, 1, 4, 1.5\n"
      "dispute, 1, 1,\n"
      "resolve, 1, 1\n"
      "Chargeback, 2, 2, \n");
  ingest::CsvReader reader{input};
  const auto records = read_all(reader);

  assert(records.size() == 6);
  assert(records[0].kind == ledger::TransactionKind::kDeposit);
  assert(records[0].client == 1);
  assert(records[0].tx == 1);
  assert(records[0].amount == common::Amount::parse("1.0"));
  assert(records[1].client == 2);
  assert(records[2].kind == ledger::TransactionKind::kWithdrawal);
  assert(records[2].amount->units() == 15'000);
  assert(records[3].kind == ledger::TransactionKind::kDispute);
  assert(!records[3].amount.has_value());
  assert(records[4].kind == ledger::TransactionKind::kResolve);
  assert(records[5].kind == ledger::TransactionKind::kChargeback);

  assert(reader.stats().rows_read == 6);
  assert(reader.stats().records_parsed == 6);
  assert(reader.stats().malformed == 0);
}

void test_csv_reader_malformed_rows() {
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,1,1.0\n"
      "transfer,1,2,1.0\n"
      "deposit,abc,3,1.0\n"
      "deposit,70000,4,1.0\n"
      "deposit,1,-5,1.0\n"
      "deposit,1,6,\n"
      "deposit,1,7,-1.0\n"
      "deposit,1,8,1.23456\n"
      "dispute,1,1,2.0\n"
      "withdrawal,1\n"
      "withdrawal,1,9,0.5\n");
  ingest::CsvReader reader{input};

  std::vector<ingest::ParseError> errors;
  reader.set_error_handler([&errors](const ingest::ParseError& error) { errors.push_back(error); });

  const auto records = read_all(reader);
  assert(records.size() == 2);
  assert(records[0].tx == 1);
  assert(records[1].tx == 9);

  assert(errors.size() == 9);
  assert(errors.front().line == 3);
  assert(errors.back().line == 11);
  assert(reader.stats().malformed == 9);
}

void test_csv_reader_header_layout() {
  // Columns are located by name, not position.
  std::istringstream reordered(
      "client,amount,tx,type\n"
      "3,4.25,10,deposit\n");
  ingest::CsvReader reader{reordered};
  const auto records = read_all(reader);
  assert(records.size() == 1);
  assert(records[0].client == 3);
  assert(records[0].tx == 10);
  assert(records[0].amount->units() == 42'500);

  // Without a header the default type,client,tx,amount order applies.
  std::istringstream headerless("deposit,5,11,1\n");
  ingest::CsvReader plain{headerless, {.has_headers = false}};
  const auto plain_records = read_all(plain);
  assert(plain_records.size() == 1);
  assert(plain_records[0].client == 5);

  // A leading byte order mark does not hide the first column name.
  std::istringstream with_bom("\xEF\xBB\xBFtype,client,tx,amount\ndeposit,4,12,2.5\n");
  ingest::CsvReader bom_reader{with_bom};
  const auto bom_records = read_all(bom_reader);
  assert(bom_records.size() == 1);
  assert(bom_records[0].client == 4);
  assert(bom_records[0].amount->units() == 25'000);

  std::istringstream bad_header("kind,who,amount\ndeposit,1,1\n");
  ingest::CsvReader bad{bad_header};
  bool threw = false;
  try {
    (void)read_all(bad);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::istringstream empty("");
  ingest::CsvReader empty_reader{empty};
  assert(read_all(empty_reader).empty());
}

void test_parse_row_amount_rules() {
  const ingest::ColumnLayout layout{};

  auto deposit = ingest::parse_row(ingest::split_fields("deposit, 1, 1, 0"), layout);
  assert(deposit.success);
  assert(deposit.record.amount->is_zero());

  auto missing = ingest::parse_row(ingest::split_fields("withdrawal,1,2"), layout);
  assert(!missing.success);
  assert(!missing.error.empty());

  auto dispute = ingest::parse_row(ingest::split_fields("dispute,1,2"), layout);
  assert(dispute.success);
  assert(!dispute.record.amount.has_value());

  auto dispute_with_amount = ingest::parse_row(ingest::split_fields("chargeback,1,2,5"), layout);
  assert(!dispute_with_amount.success);

  const auto fields = ingest::split_fields("  a ,b,, c\t");
  assert(fields.size() == 4);
  assert(fields[0] == "a");
  assert(fields[2].empty());
  assert(fields[3] == "c");
}

}  // namespace paycore::tests
