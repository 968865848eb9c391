#pragma once

namespace paycore::tests {

void test_report_writer();

}  // namespace paycore::tests
