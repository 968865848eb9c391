#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "paycore/common/spsc_ring.hpp"
#include "paycore/ledger/account_store.hpp"
#include "paycore/ledger/history_index.hpp"
#include "paycore/ledger/ledger_engine.hpp"
#include "paycore/ledger/transaction.hpp"
#include "paycore/telemetry/telemetry_sink.hpp"

namespace paycore {
namespace dispatch {

// Feeds records to ledger engines without blocking the record source on
// ledger work. Records are partitioned by client id; each partition has a
// bounded queue drained by exactly one worker thread that owns one account
// store shard, so a client's records are applied strictly in submit order.
// With zero workers records are applied inline on the submitting thread.
//
// Deposits and withdrawals that reuse a tx id are decided in submit order even
// when the clients sit on different shards: before the later record is queued,
// the shard holding the earlier one is drained.
//
// submit() must only be called from one thread.
class ShardedDispatcher {
 public:
  struct Config {
    std::size_t workers{1};
    std::size_t queue_depth{1 << 12};
  };

  struct Stats {
    std::uint64_t submitted{0};
    std::uint64_t queue_full_waits{0};
    std::uint64_t cross_shard_drains{0};
  };

  using RejectionHandler = ledger::LedgerEngine::RejectionHandler;

  explicit ShardedDispatcher(ledger::HistoryIndex& history, telemetry::TelemetrySink* telemetry = nullptr);
  ShardedDispatcher(const ShardedDispatcher&) = delete;
  ShardedDispatcher& operator=(const ShardedDispatcher&) = delete;
  ~ShardedDispatcher();

  // Rejection handler calls are serialized, whichever worker makes them. The
  // handler runs under the dispatcher's handler lock on a worker thread and
  // must not call back into the dispatcher.
  void configure(const Config& config, RejectionHandler handler = RejectionHandler{});

  void submit(const ledger::TransactionRecord& record);

  // Drains every queue and joins the workers. Rethrows the first fatal error
  // raised by a worker.
  void finish();

  // Only valid after finish(). Rows are ascending by client id.
  [[nodiscard]] std::vector<ledger::AccountSnapshot> finalize() const;
  [[nodiscard]] ledger::LedgerEngine::Stats engine_stats() const;

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  [[nodiscard]] std::size_t shard_count() const noexcept { return shards_.size(); }

 private:
  struct Shard {
    Shard(ledger::HistoryIndex& history, std::size_t queue_depth)
        : engine(accounts, history), queue(queue_depth) {}

    ledger::AccountStore accounts;
    ledger::LedgerEngine engine;
    common::SpscRing<ledger::TransactionRecord> queue;
    std::thread worker;
    std::uint64_t enqueued{0};  // producer only
    std::atomic<std::uint64_t> completed{0};
  };

  ledger::HistoryIndex& history_;
  telemetry::TelemetrySink* telemetry_;
  Config config_{};
  Stats stats_{};
  bool inline_mode_{false};
  bool finished_{false};

  std::vector<std::unique_ptr<Shard>> shards_;
  std::unordered_map<common::TxId, std::size_t> tx_owners_;
  std::atomic<bool> closing_{false};
  std::atomic<bool> failed_{false};

  std::mutex failure_mutex_;
  std::exception_ptr failure_{};

  std::mutex handler_mutex_;
  RejectionHandler rejection_handler_{};

  [[nodiscard]] std::size_t shard_index(common::ClientId client) const noexcept;
  void drain(const Shard& shard);
  void run_worker(Shard& shard);
  void apply_on(Shard& shard, const ledger::TransactionRecord& record);
  void stop_workers() noexcept;
};

}  // namespace dispatch
}  // namespace paycore
