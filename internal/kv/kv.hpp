#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/kv/result.hpp"

namespace txnstage::kv {

using Key   = std::string;
using Value = std::string;

// An empty value marks a deleted key inside write buffers.
inline bool IsTombstone(const Value& value) {
  return value.empty();
}

/*
  Per-call context passed down to the storage collaborators.

  A deadline bounds how long a timestamp wait or a commit may block.
*/
struct Context {
  std::optional<std::chrono::steady_clock::time_point> deadline;

  static Context WithTimeout(std::chrono::milliseconds timeout) {
    Context ctx;
    ctx.deadline = std::chrono::steady_clock::now() + timeout;
    return ctx;
  }
};

/*
  Ordered cursor over key/value pairs.

  Valid() becomes false once the range is exhausted.
*/
class Iterator {
 public:
  virtual ~Iterator() = default;

  virtual bool         Valid() const = 0;
  virtual const Key&   key() const   = 0;
  virtual const Value& value() const = 0;
  virtual Result       Next()        = 0;
  virtual void         Close()       = 0;
};

class Retriever {
 public:
  virtual ~Retriever() = default;

  // NotFound when the key has no visible value.
  virtual Result Get(const Key& key, Value& out) = 0;

  // Keys in [lower, upper). An empty upper bound means unbounded.
  virtual Result Iter(const Key& lower, const Key& upper, std::unique_ptr<Iterator>& out) = 0;

  // Keys strictly below upper in descending order. An empty upper bound starts at the last key.
  virtual Result IterReverse(const Key& upper, std::unique_ptr<Iterator>& out) = 0;
};

class Mutator {
 public:
  virtual ~Mutator() = default;

  virtual Result Set(const Key& key, const Value& value) = 0;
  virtual Result Delete(const Key& key)                  = 0;
};

/*
  Optimistic concurrency hints a transaction may check at commit.
*/
enum class AssumptionType {
  kNone = 0,
  kPresumeKeyNotExists,
};

/*
  Optional capability. Transactions that support assumptions also derive from
  this; callers probe for it once with dynamic_cast.
*/
class AssumptionStore {
 public:
  virtual ~AssumptionStore() = default;

  virtual void SetAssumption(const Key& key, AssumptionType assumption) = 0;
};

/*
  Abstract distributed transaction.

  Semantics every backend guarantees:

  - Writes are invisible to others until Commit()
  - Commit() and Rollback() are terminal, Valid() is false afterwards
  - Destructor MUST rollback if neither was called
*/
class Transaction : public Retriever, public Mutator {
 public:
  virtual Result Commit(const Context& ctx) = 0;
  virtual Result Rollback()                 = 0;

  virtual uint64_t StartTS() const = 0;
  virtual bool     Valid() const   = 0;

  // Capacity hint for the transaction's own write set.
  virtual void SetCap(int cap) = 0;

  virtual std::string String() const = 0;
};

/*
  Pending timestamp obtained from the time oracle.
*/
class TimestampFuture {
 public:
  virtual ~TimestampFuture() = default;

  // Blocks until the timestamp is known or the oracle failed.
  virtual Result Wait(uint64_t& ts) = 0;
};

class Oracle {
 public:
  virtual ~Oracle() = default;

  // Must not block the caller; only TimestampFuture::Wait suspends.
  virtual std::unique_ptr<TimestampFuture> GetTimestampAsync(const Context& ctx) = 0;
};

class Storage {
 public:
  virtual ~Storage() = default;

  // Begins with a fresh timestamp taken from the oracle.
  virtual Result Begin(std::unique_ptr<Transaction>& out) = 0;

  virtual Result BeginWithStartTS(uint64_t start_ts, std::unique_ptr<Transaction>& out) = 0;

  virtual Oracle& GetOracle() = 0;
};

} // namespace txnstage::kv
