#pragma once

namespace paycore::tests {

void test_amount_parse();
void test_amount_format();
void test_amount_overflow();

}  // namespace paycore::tests
