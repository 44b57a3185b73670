#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "internal/binlog/mutation_ledger.hpp"
#include "internal/dirty/dirty_db.hpp"
#include "internal/kv/kv.hpp"
#include "internal/kv/mem_buffer.hpp"
#include "internal/session/txn_future.hpp"

namespace txnstage::session {

class Session;

/*
  Lazy, statement-buffered transaction of one session.

  Phases:
    Invalid  no transaction, no future
    Pending  a TxnFuture is waiting for its start timestamp
    Valid    the transaction is begun and usable

  Statement writes go to the write buffer, binlog deltas to the mutation
  ledger and row cache changes to the dirty op log. Session::StmtCommit
  drains all three into the transaction and the session-wide structures;
  Session::StmtRollback drops them. Commit() requires them to be empty.

  Not thread safe. One instance belongs to one session.
*/
class TxnState {
 public:
  explicit TxnState(kv::MemBufferOptions options = {});

  // ------------------------------------------------------------------
  // Phase
  // ------------------------------------------------------------------
  bool Valid() const;
  bool IsPending() const;
  bool ValidOrPending() const;

  // Invalid -> Pending. Fails if a transaction or future is already held.
  kv::Result MakePending(std::unique_ptr<TxnFuture> future);

  // Invalid -> Valid, adopting an already begun transaction.
  kv::Result MakeValid(std::unique_ptr<kv::Transaction> txn);

  // Pending -> Valid. On failure no transaction is held.
  kv::Result ResolvePending(int txn_cap);

  // Drops transaction and future. Buffers are left as they are.
  void Invalidate();

  // ------------------------------------------------------------------
  // Reads and writes
  // ------------------------------------------------------------------
  kv::Result Get(const kv::Key& key, kv::Value& out);
  kv::Result Set(const kv::Key& key, const kv::Value& value);
  kv::Result Delete(const kv::Key& key);
  kv::Result Iter(const kv::Key& lower, const kv::Key& upper, std::unique_ptr<kv::Iterator>& out);
  kv::Result IterReverse(const kv::Key& upper, std::unique_ptr<kv::Iterator>& out);

  void SetAssumption(const kv::Key& key, kv::AssumptionType assumption);

  // ------------------------------------------------------------------
  // Transaction boundary. Both always leave the state Invalid.
  // ------------------------------------------------------------------
  kv::Result Commit(const kv::Context& ctx);
  kv::Result Rollback();

  // 0 unless Valid
  uint64_t StartTS() const;

  // buffered statement state
  int         BufferLen() const;
  std::size_t MutationCount() const {
    return mutations_.Size();
  }
  std::size_t DirtyOpCount() const {
    return dirty_ops_.size();
  }
  bool HasDoNotCommit() const {
    return !static_cast<bool>(do_not_commit_);
  }

  // transaction description, or the phase name
  std::string String() const;

  // Txn{state=..., startTS=..., len(...)=...}
  std::string DebugString() const;

 private:
  friend class Session;

  struct Invalid {};
  struct Pending {
    std::unique_ptr<TxnFuture> future;
  };
  struct Active {
    std::unique_ptr<kv::Transaction> txn;
    // probed once when the transaction is adopted
    kv::AssumptionStore* assumptions = nullptr;
  };
  using Phase = std::variant<Invalid, Pending, Active>;

  void Init();
  void Adopt(std::unique_ptr<kv::Transaction> txn);
  void Cleanup();
  void Reset();

  kv::Transaction* Underlying() const;
  bool             Dirty() const;

  kv::MemBufferOptions                    options_;
  Phase                                   phase_;
  std::unique_ptr<kv::MemBuffer>          buffer_;
  binlog::MutationLedger                  mutations_;
  std::vector<dirty::DirtyTableOperation> dirty_ops_;

  // Set when a statement flush failed. Commit() then rolls back and
  // returns this instead.
  kv::Result do_not_commit_;
};

} // namespace txnstage::session
