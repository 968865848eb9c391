#pragma once

namespace paycore::tests {

void test_dispatcher_inline();
void test_dispatcher_workers_match_inline();
void test_dispatcher_duplicate_tx_across_shards();
void test_dispatcher_backpressure();
void test_dispatcher_fatal_error();

}  // namespace paycore::tests
