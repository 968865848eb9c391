#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "paycore/config/config_loader.hpp"
#include "paycore/dispatch/sharded_dispatcher.hpp"
#include "paycore/ingest/csv_reader.hpp"
#include "paycore/ledger/history_index.hpp"
#include "paycore/ledger/ledger_engine.hpp"
#include "paycore/report/report_writer.hpp"
#include "paycore/telemetry/telemetry_sink.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: CSV with columns type, client, tx, amount\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./payments.toml or built-in defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./payments.toml",
      "/etc/paycore/payments.toml",
      std::filesystem::path{home ? home : ""} / ".config/paycore/payments.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(int argc, char* argv[], paycore::config::EngineConfig& cfg) {
  using paycore::config::ConfigLoader;

  const auto config_path = find_config_path(argc, argv);
  const auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                          : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }

  if (!config_path.empty()) {
    std::cerr << "Loaded config from: " << config_path << "\n";
  }
  cfg = result.config;
  return true;
}

void print_telemetry(paycore::telemetry::TelemetrySink& sink,
                     const paycore::dispatch::ShardedDispatcher::Stats& dispatch_stats) {
  using paycore::telemetry::to_string;

  std::cerr << "  records_submitted: " << dispatch_stats.submitted << "\n"
            << "  queue_full_waits: " << dispatch_stats.queue_full_waits << "\n"
            << "  cross_shard_drains: " << dispatch_stats.cross_shard_drains << "\n";

  for (const auto& sample : sink.drain()) {
    std::cerr << "  " << to_string(sample.metric) << ": " << sample.value << "\n";
  }
  for (const auto& summary : sink.drain_latency()) {
    std::cerr << "  " << to_string(summary.metric) << ": count=" << summary.count
              << " mean_ns=" << summary.mean_ns << " p99_ns=" << summary.p99_ns << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace paycore;

  if (argc < 2 || argc > 3) {
    print_usage(argv[0]);
    return kExitUsage;
  }

  config::EngineConfig cfg;
  if (!load_config(argc, argv, cfg)) {
    return kExitUsage;
  }

  std::ifstream input(argv[1]);
  if (!input) {
    std::cerr << "Cannot open transactions file: " << argv[1] << "\n";
    return kExitUsage;
  }

  telemetry::TelemetrySink sink;
  ledger::HistoryIndex history;
  dispatch::ShardedDispatcher dispatcher{history, cfg.telemetry.enabled ? &sink : nullptr};

  dispatch::ShardedDispatcher::RejectionHandler on_reject;
  if (cfg.errors.report_rejections) {
    on_reject = [](const ledger::TransactionRecord& record, const ledger::ApplyResult& result) {
      std::cerr << "rejected " << ledger::to_string(record.kind) << " client=" << record.client
                << " tx=" << record.tx << ": " << ledger::to_string(result.error) << "\n";
    };
  }

  ingest::CsvReader reader{input, {.has_headers = cfg.input.has_headers}};
  reader.set_error_handler([&cfg, &sink](const ingest::ParseError& error) {
    sink.increment(telemetry::Metric::kMalformedRecords);
    if (cfg.errors.report_malformed) {
      std::cerr << "malformed record at line " << error.line << ": " << error.message << "\n";
    }
  });

  try {
    dispatcher.configure({.workers = cfg.dispatch.workers, .queue_depth = cfg.dispatch.queue_depth},
                         std::move(on_reject));

    ledger::TransactionRecord record;
    while (reader.next(record)) {
      dispatcher.submit(record);
    }
    dispatcher.finish();

    report::write_csv(std::cout, dispatcher.finalize());
  } catch (const std::overflow_error& e) {
    std::cerr << "Fatal ledger error: " << e.what() << "\n";
    return kExitFatal;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitUsage;
  }

  if (cfg.telemetry.enabled) {
    std::cerr << "Telemetry:\n";
    print_telemetry(sink, dispatcher.stats());
  }

  return kExitOk;
}
