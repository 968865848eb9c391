#pragma once

namespace paycore::tests {

void test_csv_reader_records();
void test_csv_reader_malformed_rows();
void test_csv_reader_header_layout();
void test_parse_row_amount_rules();

}  // namespace paycore::tests
