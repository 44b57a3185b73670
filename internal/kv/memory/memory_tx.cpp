#include "memory_tx.hpp"

#include <iterator>
#include <utility>
#include <vector>

namespace txnstage::kv::memory {

namespace {

class SnapshotIterator final : public Iterator {
 public:
  explicit SnapshotIterator(std::vector<std::pair<Key, Value>> entries) : entries_(std::move(entries)) {
  }

  bool Valid() const override {
    return pos_ < entries_.size();
  }
  const Key& key() const override {
    return entries_[pos_].first;
  }
  const Value& value() const override {
    return entries_[pos_].second;
  }
  Result Next() override {
    if (pos_ < entries_.size()) ++pos_;
    return Result::Ok();
  }
  void Close() override {
    pos_ = entries_.size();
  }

 private:
  std::vector<std::pair<Key, Value>> entries_;
  std::size_t                        pos_ = 0;
};

} // namespace

MemoryTransaction::MemoryTransaction(MemoryStorage& storage, uint64_t start_ts) : storage_(storage), start_ts_(start_ts) {
  std::scoped_lock lock(storage_.mutex_);
  snapshot_ = storage_.committed_.data; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  // unfinished transactions roll back by dropping their write set
  valid_ = false;
}

std::string MemoryTransaction::String() const {
  return "memory-txn{start_ts=" + std::to_string(start_ts_) + ", cap=" + std::to_string(cap_) + "}";
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

Result MemoryTransaction::Get(const Key& key, Value& out) {
  if (!valid_) {
    return Result::Err(ErrorCode::InvalidTxnState, "transaction already finished");
  }
  if (auto it = writes_.find(key); it != writes_.end()) {
    if (IsTombstone(it->second)) {
      return Result::Err(ErrorCode::NotFound, "key deleted in transaction");
    }
    out = it->second;
    return Result::Ok();
  }
  auto it = snapshot_.find(key);
  if (it == snapshot_.end()) {
    return Result::Err(ErrorCode::NotFound, "key not found at start_ts " + std::to_string(start_ts_));
  }
  out = it->second;
  return Result::Ok();
}

std::map<Key, Value> MemoryTransaction::Merged() const {
  auto merged = snapshot_;
  for (const auto& [key, value] : writes_) {
    if (IsTombstone(value)) {
      merged.erase(key);
    } else {
      merged[key] = value;
    }
  }
  return merged;
}

Result MemoryTransaction::Iter(const Key& lower, const Key& upper, std::unique_ptr<Iterator>& out) {
  if (!valid_) {
    return Result::Err(ErrorCode::InvalidTxnState, "transaction already finished");
  }
  std::vector<std::pair<Key, Value>> entries;
  const auto                         merged = Merged();
  for (auto it = merged.lower_bound(lower); it != merged.end(); ++it) {
    if (!upper.empty() && it->first >= upper) break;
    entries.emplace_back(it->first, it->second);
  }
  out = std::make_unique<SnapshotIterator>(std::move(entries));
  return Result::Ok();
}

Result MemoryTransaction::IterReverse(const Key& upper, std::unique_ptr<Iterator>& out) {
  if (!valid_) {
    return Result::Err(ErrorCode::InvalidTxnState, "transaction already finished");
  }
  std::vector<std::pair<Key, Value>> entries;
  const auto                         merged = Merged();
  auto                               start  = upper.empty() ? merged.end() : merged.lower_bound(upper);
  for (auto it = std::make_reverse_iterator(start); it != merged.rend(); ++it) {
    entries.emplace_back(it->first, it->second);
  }
  out = std::make_unique<SnapshotIterator>(std::move(entries));
  return Result::Ok();
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

Result MemoryTransaction::Set(const Key& key, const Value& value) {
  if (!valid_) {
    return Result::Err(ErrorCode::InvalidTxnState, "transaction already finished");
  }
  if (value.empty()) {
    return Result::Err(ErrorCode::EmptyValue, "cannot set empty value for key " + key);
  }
  writes_[key] = value;
  return Result::Ok();
}

Result MemoryTransaction::Delete(const Key& key) {
  if (!valid_) {
    return Result::Err(ErrorCode::InvalidTxnState, "transaction already finished");
  }
  writes_[key] = Value{};
  return Result::Ok();
}

void MemoryTransaction::SetAssumption(const Key& key, AssumptionType assumption) {
  assumptions_[key] = assumption;
}

// ------------------------------------------------------------
// Commit / Rollback
// ------------------------------------------------------------

Result MemoryTransaction::Commit(const Context& ctx) {
  if (!valid_) {
    return Result::Err(ErrorCode::InvalidTxnState, "commit on finished transaction");
  }
  valid_ = false;

  if (ctx.deadline && std::chrono::steady_clock::now() > *ctx.deadline) {
    return Result::Err(ErrorCode::UnderlyingStoreError, "commit deadline exceeded");
  }

  std::scoped_lock lock(storage_.mutex_);
  auto&            committed = storage_.committed_;

  for (const auto& [key, assumption] : assumptions_) {
    if (assumption == AssumptionType::kPresumeKeyNotExists && committed.data.count(key) > 0) {
      return Result::Err(ErrorCode::AssumptionViolated, "key presumed absent already exists: " + key);
    }
  }

  for (const auto& [key, value] : writes_) {
    auto it = committed.commit_ts.find(key);
    if (it != committed.commit_ts.end() && it->second > start_ts_) {
      return Result::Err(ErrorCode::WriteConflict, "key " + key + " committed at " + std::to_string(it->second) + " after start_ts " +
                                                       std::to_string(start_ts_));
    }
  }

  const uint64_t commit_ts = storage_.oracle_.Next();
  for (const auto& [key, value] : writes_) {
    if (IsTombstone(value)) {
      committed.data.erase(key);
    } else {
      committed.data[key] = value;
    }
    committed.commit_ts[key] = commit_ts;
  }
  storage_.commit_count_++;
  return Result::Ok();
}

Result MemoryTransaction::Rollback() {
  if (!valid_) {
    return Result::Err(ErrorCode::InvalidTxnState, "rollback on finished transaction");
  }
  valid_ = false;
  writes_.clear();
  assumptions_.clear();
  return Result::Ok();
}

} // namespace txnstage::kv::memory
