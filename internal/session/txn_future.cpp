#include "txn_future.hpp"

#include "internal/observability/logging.hpp"

namespace txnstage::session {

using txnstage::observability::IntField;
using txnstage::observability::StringField;

TxnFuture::TxnFuture(std::unique_ptr<kv::TimestampFuture> future, kv::Storage& storage, bool fail)
    : future_(std::move(future)), storage_(storage), fail_(fail) {
}

kv::Result TxnFuture::Wait(std::unique_ptr<kv::Transaction>& out) {
  if (fail_) {
    return kv::Result::Err(kv::ErrorCode::TimestampUnavailable, "injected get timestamp failure");
  }
  if (!future_) {
    return kv::Result::Err(kv::ErrorCode::FutureNotSet, "transaction future already consumed");
  }

  auto     future   = std::move(future_);
  uint64_t start_ts = 0;
  auto     waited   = future->Wait(start_ts);
  if (waited) {
    return storage_.BeginWithStartTS(start_ts, out).Annotate("begin with start_ts " + std::to_string(start_ts));
  }

  // The requested timestamp is dropped. Begin() asks the oracle again.
  TXNSTAGE_LOG_WARN("timestamp wait failed, beginning with fresh timestamp", {StringField("error", waited.ToString())});
  auto begun = storage_.Begin(out);
  if (!begun) {
    return begun.Annotate("fresh begin after timestamp failure");
  }
  TXNSTAGE_LOG_DEBUG("fallback transaction started", {IntField("start_ts", static_cast<int64_t>(out->StartTS()))});
  return kv::Result::Ok();
}

std::unique_ptr<TxnFuture> AcquireTxnFuture(kv::Storage& storage, const kv::Context& ctx, const FaultInjection& faults) {
  auto ts_future = storage.GetOracle().GetTimestampAsync(ctx);
  return std::make_unique<TxnFuture>(std::move(ts_future), storage, faults.fail_get_timestamp);
}

} // namespace txnstage::session
