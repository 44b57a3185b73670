#pragma once

#include <memory>

#include "internal/kv/kv.hpp"
#include "internal/session/fault_injection.hpp"

namespace txnstage::session {

/*
  Promise of a transaction.

  Holds the start timestamp request issued to the oracle. Wait() is the
  only place a session blocks on the oracle, and it may run only once.
*/
class TxnFuture {
 public:
  TxnFuture(std::unique_ptr<kv::TimestampFuture> future, kv::Storage& storage, bool fail = false);

  // Begins a transaction at the awaited timestamp. An oracle failure falls
  // back to a fresh begin; only the injected failure is reported as
  // TimestampUnavailable.
  kv::Result Wait(std::unique_ptr<kv::Transaction>& out);

  bool Consumed() const {
    return future_ == nullptr;
  }

 private:
  std::unique_ptr<kv::TimestampFuture> future_;
  kv::Storage&                         storage_;
  bool                                 fail_;
};

// Requests a start timestamp without blocking.
std::unique_ptr<TxnFuture> AcquireTxnFuture(kv::Storage& storage, const kv::Context& ctx, const FaultInjection& faults);

} // namespace txnstage::session
