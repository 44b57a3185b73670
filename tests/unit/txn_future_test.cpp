#include "internal/session/txn_future.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/kv/memory/memory_storage.hpp"
#include "recording_storage.hpp"

namespace {

using txnstage::kv::Context;
using txnstage::kv::ErrorCode;
using txnstage::kv::Transaction;
using txnstage::kv::memory::MemoryStorage;
using txnstage::session::AcquireTxnFuture;
using txnstage::session::FaultInjection;
using txnstage::testing::CountOps;
using txnstage::testing::OpLog;
using txnstage::testing::RecordingStorage;

void TestBeginsAtRequestedTimestamp() {
  MemoryStorage storage;
  auto          future = AcquireTxnFuture(storage, Context{}, FaultInjection{});

  std::unique_ptr<Transaction> txn;
  assert(future->Wait(txn));
  assert(txn != nullptr && txn->Valid());
  // the awaited timestamp is the only one allocated
  assert(txn->StartTS() == 1);
  assert(storage.Clock().Last() == 1);
  assert(future->Consumed());
}

void TestInjectedFailureIsDeterministic() {
  MemoryStorage  storage;
  FaultInjection faults;
  faults.fail_get_timestamp = true;

  auto future = AcquireTxnFuture(storage, Context{}, faults);

  std::unique_ptr<Transaction> txn;
  assert(future->Wait(txn).Is(ErrorCode::TimestampUnavailable));
  assert(txn == nullptr);
  assert(future->Wait(txn).Is(ErrorCode::TimestampUnavailable));
}

void TestOracleFailureFallsBackToFreshBegin() {
  auto             log = std::make_shared<std::vector<std::string>>();
  RecordingStorage storage(log);
  storage.Inner().Clock().SetUnavailable(true);

  auto future = AcquireTxnFuture(storage, Context{}, FaultInjection{});

  std::unique_ptr<Transaction> txn;
  assert(future->Wait(txn));
  assert(txn != nullptr && txn->Valid());
  assert(CountOps(log, "begin") == 1);
  assert(CountOps(log, "begin_with_ts") == 0);
  assert(txn->StartTS() == storage.Inner().Clock().Last());
}

void TestSecondWaitReportsFutureNotSet() {
  MemoryStorage storage;
  auto          future = AcquireTxnFuture(storage, Context{}, FaultInjection{});

  std::unique_ptr<Transaction> txn;
  assert(future->Wait(txn));

  std::unique_ptr<Transaction> again;
  assert(future->Wait(again).Is(ErrorCode::FutureNotSet));
  assert(again == nullptr);
}

} // namespace

int main() {
  TestBeginsAtRequestedTimestamp();
  TestInjectedFailureIsDeterministic();
  TestOracleFailureFallsBackToFreshBegin();
  TestSecondWaitReportsFutureNotSet();

  std::cout << "txnstage_unit_txn_future: pass\n";
  return 0;
}
