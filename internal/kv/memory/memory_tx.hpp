#pragma once

#include <map>
#include <string>
#include <unordered_map>

#include "internal/kv/kv.hpp"
#include "memory_storage.hpp"

namespace txnstage::kv::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public Transaction, public AssumptionStore {
 public:
  MemoryTransaction(MemoryStorage& storage, uint64_t start_ts);
  ~MemoryTransaction();

  Result Get(const Key& key, Value& out) override;
  Result Iter(const Key& lower, const Key& upper, std::unique_ptr<Iterator>& out) override;
  Result IterReverse(const Key& upper, std::unique_ptr<Iterator>& out) override;

  Result Set(const Key& key, const Value& value) override;
  Result Delete(const Key& key) override;

  Result Commit(const Context& ctx) override;
  Result Rollback() override;

  uint64_t StartTS() const override {
    return start_ts_;
  }
  bool Valid() const override {
    return valid_;
  }
  void SetCap(int cap) override {
    cap_ = cap;
  }
  int Cap() const {
    return cap_;
  }

  std::string String() const override;

  void SetAssumption(const Key& key, AssumptionType assumption) override;

 private:
  std::map<Key, Value> Merged() const;

  MemoryStorage&                            storage_;
  uint64_t                                  start_ts_;
  std::map<Key, Value>                      snapshot_;
  std::map<Key, Value>                      writes_;
  std::unordered_map<Key, AssumptionType>   assumptions_;
  int                                       cap_   = 0;
  bool                                      valid_ = true;
};

} // namespace txnstage::kv::memory
