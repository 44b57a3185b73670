#pragma once

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/kv/kv.hpp"
#include "internal/kv/memory/memory_storage.hpp"

namespace txnstage::testing {

using OpLog = std::shared_ptr<std::vector<std::string>>;

inline std::size_t CountOps(const OpLog& log, const std::string& op) {
  return static_cast<std::size_t>(std::count(log->begin(), log->end(), op));
}

// Forwards to a real transaction and records every mutating call.
// Does not expose the assumption capability.
class RecordingTransaction final : public kv::Transaction {
 public:
  RecordingTransaction(std::unique_ptr<kv::Transaction> inner, OpLog log, std::string fail_set_key)
      : inner_(std::move(inner)), log_(std::move(log)), fail_set_key_(std::move(fail_set_key)) {
  }

  kv::Result Get(const kv::Key& key, kv::Value& out) override {
    return inner_->Get(key, out);
  }
  kv::Result Iter(const kv::Key& lower, const kv::Key& upper, std::unique_ptr<kv::Iterator>& out) override {
    return inner_->Iter(lower, upper, out);
  }
  kv::Result IterReverse(const kv::Key& upper, std::unique_ptr<kv::Iterator>& out) override {
    return inner_->IterReverse(upper, out);
  }
  kv::Result Set(const kv::Key& key, const kv::Value& value) override {
    log_->push_back("set:" + key);
    if (!fail_set_key_.empty() && key == fail_set_key_) {
      return kv::Result::Err(kv::ErrorCode::UnderlyingStoreError, "store rejected " + key);
    }
    return inner_->Set(key, value);
  }
  kv::Result Delete(const kv::Key& key) override {
    log_->push_back("delete:" + key);
    return inner_->Delete(key);
  }
  kv::Result Commit(const kv::Context& ctx) override {
    log_->push_back("commit");
    return inner_->Commit(ctx);
  }
  kv::Result Rollback() override {
    log_->push_back("rollback");
    return inner_->Rollback();
  }
  uint64_t StartTS() const override {
    return inner_->StartTS();
  }
  bool Valid() const override {
    return inner_->Valid();
  }
  void SetCap(int cap) override {
    log_->push_back("cap:" + std::to_string(cap));
    inner_->SetCap(cap);
  }
  std::string String() const override {
    return "recording(" + inner_->String() + ")";
  }

 private:
  std::unique_ptr<kv::Transaction> inner_;
  OpLog                            log_;
  std::string                      fail_set_key_;
};

class RecordingStorage final : public kv::Storage {
 public:
  explicit RecordingStorage(OpLog log, std::string fail_set_key = {}) : log_(std::move(log)), fail_set_key_(std::move(fail_set_key)) {
  }

  kv::Result Begin(std::unique_ptr<kv::Transaction>& out) override {
    log_->push_back("begin");
    std::unique_ptr<kv::Transaction> inner;
    TXNSTAGE_RETURN_NOT_OK(inner_.Begin(inner));
    auto txn  = std::make_unique<RecordingTransaction>(std::move(inner), log_, fail_set_key_);
    last_txn_ = txn.get();
    out       = std::move(txn);
    return kv::Result::Ok();
  }

  kv::Result BeginWithStartTS(uint64_t start_ts, std::unique_ptr<kv::Transaction>& out) override {
    log_->push_back("begin_with_ts");
    std::unique_ptr<kv::Transaction> inner;
    TXNSTAGE_RETURN_NOT_OK(inner_.BeginWithStartTS(start_ts, inner));
    auto txn  = std::make_unique<RecordingTransaction>(std::move(inner), log_, fail_set_key_);
    last_txn_ = txn.get();
    out       = std::move(txn);
    return kv::Result::Ok();
  }

  kv::Oracle& GetOracle() override {
    return inner_.GetOracle();
  }

  kv::memory::MemoryStorage& Inner() {
    return inner_;
  }

  // most recently begun transaction, owned by whoever began it
  kv::Transaction* LastTxn() const {
    return last_txn_;
  }

 private:
  kv::memory::MemoryStorage inner_;
  OpLog                     log_;
  std::string               fail_set_key_;
  kv::Transaction*          last_txn_ = nullptr;
};

// Commits key/value pairs straight into the storage.
inline void Seed(kv::Storage& storage, const std::vector<std::pair<kv::Key, kv::Value>>& entries) {
  std::unique_ptr<kv::Transaction> txn;
  if (!storage.Begin(txn)) throw std::runtime_error("seed begin failed");
  for (const auto& [key, value] : entries) {
    if (!txn->Set(key, value)) throw std::runtime_error("seed set failed: " + key);
  }
  if (auto r = txn->Commit(kv::Context{}); !r) throw std::runtime_error("seed commit failed: " + r.ToString());
}

} // namespace txnstage::testing
