#include "paycore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace paycore {
namespace config {

namespace {
constexpr std::size_t kMaxWorkers = 64;

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

// A negative value is reported as a validation error and leaves the default.
std::size_t get_size_or(const toml::table& tbl, std::string_view key, std::size_t default_val,
                        std::vector<ValidationError>& errors, std::string_view section) {
  const auto val = get_int_or(tbl, key, static_cast<std::int64_t>(default_val));
  if (val < 0) {
    errors.push_back({std::string(section) + "." + std::string(key), "must not be negative"});
    return default_val;
  }
  return static_cast<std::size_t>(val);
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.has_headers = get_bool_or(*input, "has_headers", cfg.has_headers);
  }
  return cfg;
}

DispatchConfig parse_dispatch(const toml::table& root, std::vector<ValidationError>& errors) {
  DispatchConfig cfg;
  if (auto* dispatch = root["dispatch"].as_table()) {
    cfg.workers = get_size_or(*dispatch, "workers", cfg.workers, errors, "dispatch");
    cfg.queue_depth = get_size_or(*dispatch, "queue_depth", cfg.queue_depth, errors, "dispatch");
  }
  return cfg;
}

ErrorReportingConfig parse_errors(const toml::table& root) {
  ErrorReportingConfig cfg;
  if (auto* errors = root["errors"].as_table()) {
    cfg.report_rejections = get_bool_or(*errors, "report_rejections", cfg.report_rejections);
    cfg.report_malformed = get_bool_or(*errors, "report_malformed", cfg.report_malformed);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  EngineConfig cfg;
  cfg.input = parse_input(root);
  cfg.dispatch = parse_dispatch(root, errors);
  cfg.errors = parse_errors(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

void finish_load(LoadResult& result, const toml::table& root) {
  std::vector<ValidationError> field_errors;
  result.config = parse_config(root, field_errors);
  result.errors = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.begin(), field_errors.begin(), field_errors.end());
  result.success = result.errors.empty();
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  finish_load(result, parse_result.table());
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  finish_load(result, parse_result.table());
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.dispatch.workers > kMaxWorkers) {
    errors.push_back({"dispatch.workers", "must be at most " + std::to_string(kMaxWorkers)});
  }

  const auto depth = config.dispatch.queue_depth;
  if (depth < 2 || (depth & (depth - 1)) != 0) {
    errors.push_back({"dispatch.queue_depth", "must be a power of two >= 2"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# paycore payments engine configuration
# Generated default configuration

[input]
has_headers = true

[dispatch]
workers = 1          # 0 applies records on the reading thread
queue_depth = 4096   # per worker, power of two

[errors]
report_rejections = true   # log rejected records to stderr
report_malformed = true    # log unparseable rows to stderr

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace paycore
