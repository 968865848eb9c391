#include "test_config.hpp"

#include <cassert>
#include <string>

#include "paycore/config/config_loader.hpp"

namespace paycore::tests {

void test_config_defaults() {
  auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.success);
  assert(result.errors.empty());
  assert(result.config.input.has_headers);
  assert(result.config.dispatch.workers == 1);
  assert(result.config.dispatch.queue_depth == 4096);
  assert(result.config.errors.report_rejections);
  assert(result.config.telemetry.enabled);

  // Missing sections fall back to built-in values.
  auto empty = config::ConfigLoader::load_from_string("");
  assert(empty.success);
  assert(empty.config.dispatch.workers == 1);
}

void test_config_overrides() {
  auto result = config::ConfigLoader::load_from_string(R"(
[input]
has_headers = false

[dispatch]
workers = 0
queue_depth = 64

[errors]
report_rejections = false

[telemetry]
enabled = false
)");
  assert(result.success);
  assert(!result.config.input.has_headers);
  assert(result.config.dispatch.workers == 0);
  assert(result.config.dispatch.queue_depth == 64);
  assert(!result.config.errors.report_rejections);
  assert(result.config.errors.report_malformed);
  assert(!result.config.telemetry.enabled);
}

void test_config_validation() {
  auto bad_values = config::ConfigLoader::load_from_string(R"(
[dispatch]
workers = 65
queue_depth = 100
)");
  assert(!bad_values.success);
  assert(bad_values.errors.size() == 2);
  assert(bad_values.errors[0].field == "dispatch.workers");
  assert(bad_values.errors[1].field == "dispatch.queue_depth");

  auto negative = config::ConfigLoader::load_from_string("[dispatch]\nworkers = -1\n");
  assert(!negative.success);
  assert(negative.errors.front().field == "dispatch.workers");

  auto broken = config::ConfigLoader::load_from_string("[dispatch\nworkers = ");
  assert(!broken.success);
  assert(!broken.raw_error.empty());

  auto missing = config::ConfigLoader::load("/nonexistent/paycore/payments.toml");
  assert(!missing.success);
  assert(missing.raw_error.find("not found") != std::string::npos);
}

}  // namespace paycore::tests
