#pragma once

namespace paycore::tests {

void test_ledger_deposit_and_withdrawal();
void test_ledger_sample_scenarios();
void test_ledger_duplicate_tx_across_clients();
void test_ledger_dispute_resolve();
void test_ledger_chargeback_locks_account();
void test_ledger_unknown_references();
void test_ledger_dispute_lifecycle_rejections();
void test_ledger_withdrawal_dispute();
void test_ledger_dispute_exceeding_available();
void test_ledger_conservation_invariant();
void test_ledger_rejection_handler_and_stats();
void test_ledger_overflow_is_fatal();

}  // namespace paycore::tests
