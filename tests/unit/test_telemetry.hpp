#pragma once

namespace paycore::tests {

void test_telemetry_sink();

}  // namespace paycore::tests
