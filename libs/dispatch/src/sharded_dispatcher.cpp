#include "paycore/dispatch/sharded_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "paycore/common/time_utils.hpp"

namespace paycore {
namespace dispatch {

namespace {
constexpr std::size_t kMaxWorkers = 64;
constexpr std::uint32_t kIdleSpins = 64;
constexpr auto kIdleSleep = std::chrono::microseconds{50};

telemetry::Metric metric_for(ledger::ApplyError error) noexcept {
  switch (error) {
    case ledger::ApplyError::kNone:
      return telemetry::Metric::kRecordsApplied;
    case ledger::ApplyError::kDuplicateTransaction:
      return telemetry::Metric::kRejectedDuplicate;
    case ledger::ApplyError::kAccountLocked:
      return telemetry::Metric::kRejectedLocked;
    case ledger::ApplyError::kInsufficientFunds:
      return telemetry::Metric::kRejectedInsufficientFunds;
    case ledger::ApplyError::kUnknownTransaction:
      return telemetry::Metric::kRejectedUnknown;
    case ledger::ApplyError::kInvalidState:
      return telemetry::Metric::kRejectedInvalidState;
  }
  return telemetry::Metric::kRecordsApplied;
}
}  // namespace

ShardedDispatcher::ShardedDispatcher(ledger::HistoryIndex& history, telemetry::TelemetrySink* telemetry)
    : history_(history), telemetry_(telemetry) {}

ShardedDispatcher::~ShardedDispatcher() {
  stop_workers();
}

void ShardedDispatcher::configure(const Config& config, RejectionHandler handler) {
  if (!shards_.empty()) {
    throw std::logic_error("dispatcher already configured");
  }
  if (config.workers > kMaxWorkers) {
    throw std::invalid_argument("dispatcher supports at most " + std::to_string(kMaxWorkers) + " workers");
  }

  config_ = config;
  rejection_handler_ = std::move(handler);
  inline_mode_ = config.workers == 0;

  const std::size_t shard_count = inline_mode_ ? 1 : config.workers;
  shards_.reserve(shard_count);
  for (std::size_t idx = 0; idx < shard_count; ++idx) {
    shards_.push_back(std::make_unique<Shard>(history_, config.queue_depth));
  }

  for (auto& shard : shards_) {
    shard->engine.set_rejection_handler([this](const ledger::TransactionRecord& record,
                                               const ledger::ApplyResult& result) {
      std::scoped_lock lock(handler_mutex_);
      if (rejection_handler_) {
        rejection_handler_(record, result);
      }
    });
  }

  if (!inline_mode_) {
    for (auto& shard : shards_) {
      Shard& target = *shard;
      target.worker = std::thread([this, &target] { run_worker(target); });
    }
  }
}

void ShardedDispatcher::submit(const ledger::TransactionRecord& record) {
  if (shards_.empty()) {
    throw std::logic_error("dispatcher not configured");
  }
  if (finished_) {
    throw std::logic_error("dispatcher already finished");
  }
  if (failed_.load(std::memory_order_acquire)) {
    finish();
  }

  ++stats_.submitted;
  const std::size_t index = shard_index(record.client);
  auto& shard = *shards_[index];

  if (inline_mode_) {
    apply_on(shard, record);
    return;
  }

  // A tx id reused across shards is settled in submit order: the shard that
  // claimed it last must finish with it before another shard may try.
  if (ledger::carries_amount(record.kind)) {
    auto [it, inserted] = tx_owners_.try_emplace(record.tx, index);
    if (!inserted && it->second != index) {
      ++stats_.cross_shard_drains;
      drain(*shards_[it->second]);
      it->second = index;
    }
  }

  ledger::TransactionRecord pending = record;
  while (!shard.queue.push(pending)) {
    if (failed_.load(std::memory_order_acquire)) {
      finish();
    }
    ++stats_.queue_full_waits;
    std::this_thread::yield();
  }
  ++shard.enqueued;
}

void ShardedDispatcher::finish() {
  if (!finished_) {
    finished_ = true;
    stop_workers();
  }

  std::scoped_lock lock(failure_mutex_);
  if (failure_) {
    std::rethrow_exception(failure_);
  }
}

std::vector<ledger::AccountSnapshot> ShardedDispatcher::finalize() const {
  if (!finished_ && !inline_mode_) {
    throw std::logic_error("finalize() called before finish()");
  }

  std::vector<ledger::AccountSnapshot> rows;
  for (const auto& shard : shards_) {
    auto shard_rows = shard->engine.finalize();
    rows.insert(rows.end(), shard_rows.begin(), shard_rows.end());
  }
  std::sort(rows.begin(), rows.end(), [](const ledger::AccountSnapshot& lhs, const ledger::AccountSnapshot& rhs) {
    return lhs.client < rhs.client;
  });
  return rows;
}

ledger::LedgerEngine::Stats ShardedDispatcher::engine_stats() const {
  ledger::LedgerEngine::Stats total;
  for (const auto& shard : shards_) {
    const auto& stats = shard->engine.stats();
    total.applied += stats.applied;
    total.rejected_duplicate += stats.rejected_duplicate;
    total.rejected_locked += stats.rejected_locked;
    total.rejected_insufficient_funds += stats.rejected_insufficient_funds;
    total.rejected_unknown += stats.rejected_unknown;
    total.rejected_invalid_state += stats.rejected_invalid_state;
  }
  return total;
}

std::size_t ShardedDispatcher::shard_index(common::ClientId client) const noexcept {
  return static_cast<std::size_t>(client) % shards_.size();
}

void ShardedDispatcher::drain(const Shard& shard) {
  while (shard.completed.load(std::memory_order_acquire) != shard.enqueued) {
    if (failed_.load(std::memory_order_acquire)) {
      finish();
    }
    std::this_thread::yield();
  }
}

void ShardedDispatcher::run_worker(Shard& shard) {
  ledger::TransactionRecord record;
  std::uint32_t idle = 0;
  while (true) {
    if (shard.queue.pop(record)) {
      idle = 0;
      try {
        apply_on(shard, record);
      } catch (...) {
        std::scoped_lock lock(failure_mutex_);
        if (!failure_) {
          failure_ = std::current_exception();
        }
        failed_.store(true, std::memory_order_release);
        return;
      }
      shard.completed.fetch_add(1, std::memory_order_release);
      continue;
    }

    if (closing_.load(std::memory_order_acquire) && shard.queue.empty()) {
      return;
    }
    if (idle < kIdleSpins) {
      ++idle;
      std::this_thread::yield();
    } else {
      std::this_thread::sleep_for(kIdleSleep);
    }
  }
}

void ShardedDispatcher::apply_on(Shard& shard, const ledger::TransactionRecord& record) {
  const common::Stopwatch stopwatch;
  const auto result = shard.engine.apply(record);
  if (telemetry_) {
    telemetry_->record_latency(telemetry::Metric::kApplyLatency, stopwatch.elapsed());
    telemetry_->increment(metric_for(result.error));
  }
}

void ShardedDispatcher::stop_workers() noexcept {
  closing_.store(true, std::memory_order_release);
  for (auto& shard : shards_) {
    if (shard->worker.joinable()) {
      shard->worker.join();
    }
  }
}

}  // namespace dispatch
}  // namespace paycore
