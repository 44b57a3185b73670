#include "memory_storage.hpp"

#include <future>

#include "memory_tx.hpp"

namespace txnstage::kv::memory {

namespace {

class MemoryTimestampFuture final : public TimestampFuture {
 public:
  MemoryTimestampFuture(std::future<std::optional<uint64_t>> future, std::optional<std::chrono::steady_clock::time_point> deadline)
      : future_(std::move(future)), deadline_(deadline) {
  }

  Result Wait(uint64_t& ts) override {
    if (!future_.valid()) {
      return Result::Err(ErrorCode::TimestampUnavailable, "timestamp future already consumed");
    }
    if (deadline_ && future_.wait_until(*deadline_) != std::future_status::ready) {
      return Result::Err(ErrorCode::TimestampUnavailable, "timestamp wait deadline exceeded");
    }
    auto allocated = future_.get();
    if (!allocated) {
      return Result::Err(ErrorCode::TimestampUnavailable, "oracle unavailable");
    }
    ts = *allocated;
    return Result::Ok();
  }

 private:
  std::future<std::optional<uint64_t>>                 future_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace

// ------------------------------------------------------------
// Oracle
// ------------------------------------------------------------

uint64_t MemoryOracle::Next() {
  return ++last_ts_;
}

std::unique_ptr<TimestampFuture> MemoryOracle::GetTimestampAsync(const Context& ctx) {
  auto future = std::async(std::launch::async, [this]() -> std::optional<uint64_t> {
    if (unavailable_) {
      return std::nullopt;
    }
    return Next();
  });
  return std::make_unique<MemoryTimestampFuture>(std::move(future), ctx.deadline);
}

// ------------------------------------------------------------
// Storage
// ------------------------------------------------------------

Result MemoryStorage::Begin(std::unique_ptr<Transaction>& out) {
  out = std::make_unique<MemoryTransaction>(*this, oracle_.Next());
  return Result::Ok();
}

Result MemoryStorage::BeginWithStartTS(uint64_t start_ts, std::unique_ptr<Transaction>& out) {
  if (start_ts == 0) {
    return Result::Err(ErrorCode::UnderlyingStoreError, "start timestamp must be positive");
  }
  out = std::make_unique<MemoryTransaction>(*this, start_ts);
  return Result::Ok();
}

std::optional<Value> MemoryStorage::Read(const Key& key) const {
  std::scoped_lock lock(mutex_);
  auto it = committed_.data.find(key);
  if (it == committed_.data.end()) {
    return std::nullopt;
  }
  return it->second;
}

uint64_t MemoryStorage::CommitCount() const {
  std::scoped_lock lock(mutex_);
  return commit_count_;
}

} // namespace txnstage::kv::memory
