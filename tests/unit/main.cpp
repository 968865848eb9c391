// Unit test runner - calls test functions from per-component test files

#include <iostream>

#include "test_amount.hpp"
#include "test_config.hpp"
#include "test_dispatch.hpp"
#include "test_ingest.hpp"
#include "test_ledger.hpp"
#include "test_report.hpp"
#include "test_telemetry.hpp"

int main() {
  using namespace paycore::tests;

  // Amount tests
  test_amount_parse();
  test_amount_format();
  test_amount_overflow();

  // Ledger tests
  test_ledger_deposit_and_withdrawal();
  test_ledger_sample_scenarios();
  test_ledger_duplicate_tx_across_clients();
  test_ledger_dispute_resolve();
  test_ledger_chargeback_locks_account();
  test_ledger_unknown_references();
  test_ledger_dispute_lifecycle_rejections();
  test_ledger_withdrawal_dispute();
  test_ledger_dispute_exceeding_available();
  test_ledger_conservation_invariant();
  test_ledger_rejection_handler_and_stats();
  test_ledger_overflow_is_fatal();

  // Ingest tests
  test_csv_reader_records();
  test_csv_reader_malformed_rows();
  test_csv_reader_header_layout();
  test_parse_row_amount_rules();

  // Dispatch tests
  test_dispatcher_inline();
  test_dispatcher_workers_match_inline();
  test_dispatcher_duplicate_tx_across_shards();
  test_dispatcher_backpressure();
  test_dispatcher_fatal_error();

  // Report tests
  test_report_writer();

  // Config tests
  test_config_defaults();
  test_config_overrides();
  test_config_validation();

  // Telemetry tests
  test_telemetry_sink();

  std::cout << "all unit tests passed\n";
  return 0;
}
