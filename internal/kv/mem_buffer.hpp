#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

#include "internal/kv/kv.hpp"

namespace txnstage::kv {

inline constexpr uint64_t kDefaultEntrySizeLimit = 6 * 1024 * 1024;
inline constexpr uint64_t kDefaultTotalSizeLimit = 100 * 1024 * 1024;
inline constexpr int      kDefaultTxnMembufCap   = 4 * 1024;

struct MemBufferOptions {
  uint64_t entry_size_limit = kDefaultEntrySizeLimit;
  uint64_t total_size_limit = kDefaultTotalSizeLimit;
};

/*
  Ordered write overlay.

  Holds every write of the running statement before it reaches the
  transaction. Deletes are stored as tombstones (empty values) so they
  shadow values visible through the transaction underneath.
*/
class MemBuffer final : public Retriever, public Mutator {
 public:
  explicit MemBuffer(MemBufferOptions options = {});

  // Tombstones are returned as-is; callers decide what an empty value means.
  Result Get(const Key& key, Value& out) override;
  Result Iter(const Key& lower, const Key& upper, std::unique_ptr<Iterator>& out) override;
  Result IterReverse(const Key& upper, std::unique_ptr<Iterator>& out) override;

  Result Set(const Key& key, const Value& value) override;
  Result Delete(const Key& key) override;

  // number of entries, tombstones included
  int Len() const {
    return static_cast<int>(entries_.size());
  }

  // bytes of keys and values held
  uint64_t Size() const {
    return size_;
  }

  bool Empty() const {
    return entries_.empty();
  }

  // Drops all entries. Limits are kept.
  void Reset();

  const MemBufferOptions& Options() const {
    return options_;
  }

 private:
  friend Result WalkMemBuffer(const MemBuffer& buffer, const std::function<Result(const Key&, const Value&)>& fn);

  Result Put(const Key& key, const Value& value);

  MemBufferOptions     options_;
  std::map<Key, Value> entries_;
  uint64_t             size_ = 0;
};

/*
  Visits every entry in key order, tombstones included.

  Stops at the first callback failure and returns it.
*/
Result WalkMemBuffer(const MemBuffer& buffer, const std::function<Result(const Key&, const Value&)>& fn);

} // namespace txnstage::kv
