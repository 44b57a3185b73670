#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/kv/kv.hpp"

namespace txnstage::kv::memory {

class MemoryTransaction;

/*
  Monotonic timestamp source.

  Can be flagged unavailable to exercise the fresh-begin fallback.
*/
class MemoryOracle final : public Oracle {
 public:
  std::unique_ptr<TimestampFuture> GetTimestampAsync(const Context& ctx) override;

  // Synchronous allocation, used for commit timestamps and fresh begins.
  uint64_t Next();

  void SetUnavailable(bool unavailable) {
    unavailable_ = unavailable;
  }

  uint64_t Last() const {
    return last_ts_.load();
  }

 private:
  std::atomic<uint64_t> last_ts_{0};
  std::atomic<bool>     unavailable_{false};
};

/*
  In-process storage with snapshot transactions.

  Commit is first-committer-wins: a transaction fails with WriteConflict
  if any key it writes was committed after its start timestamp.
*/
class MemoryStorage final : public Storage {
 public:
  MemoryStorage() = default;

  Result Begin(std::unique_ptr<Transaction>& out) override;
  Result BeginWithStartTS(uint64_t start_ts, std::unique_ptr<Transaction>& out) override;

  Oracle& GetOracle() override {
    return oracle_;
  }

  MemoryOracle& Clock() {
    return oracle_;
  }

  // committed value, bypassing any transaction
  std::optional<Value> Read(const Key& key) const;

  uint64_t CommitCount() const;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<Key, Value>              data;
    std::unordered_map<Key, uint64_t> commit_ts;
  };

  mutable std::mutex mutex_;
  State              committed_;
  uint64_t           commit_count_ = 0;
  MemoryOracle       oracle_;
};

} // namespace txnstage::kv::memory
