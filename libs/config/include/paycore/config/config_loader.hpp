#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace paycore {
namespace config {

struct InputConfig {
  bool has_headers{true};
};

struct DispatchConfig {
  std::size_t workers{1};
  std::size_t queue_depth{1 << 12};
};

struct ErrorReportingConfig {
  bool report_rejections{true};
  bool report_malformed{true};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct EngineConfig {
  InputConfig input;
  DispatchConfig dispatch;
  ErrorReportingConfig errors;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace paycore
