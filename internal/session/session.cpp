#include "session.hpp"

#include "internal/observability/logging.hpp"

namespace txnstage::session {

using txnstage::observability::IntField;
using txnstage::observability::StringField;

Session::Session(kv::Storage& storage, config::TxnSettings settings, FaultInjection faults)
    : storage_(storage), settings_(settings), faults_(faults), txn_(settings.membuf) {
}

// ------------------------------------------------------------
// Transaction boundary
// ------------------------------------------------------------

kv::Result Session::PrepareTxnFuture(const kv::Context& ctx) {
  if (txn_.ValidOrPending()) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "prepare transaction on " + txn_.DebugString());
  }
  binlog_.Clear();
  dirty_db_.Clear();
  return txn_.MakePending(AcquireTxnFuture(storage_, ctx, faults_));
}

kv::Result Session::ActivateTxn() {
  if (txn_.Valid()) {
    return kv::Result::Ok();
  }
  if (!txn_.IsPending()) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "activate on " + txn_.DebugString());
  }

  auto resolved = txn_.ResolvePending(settings_.txn_write_capacity);
  if (!resolved) {
    TXNSTAGE_LOG_WARN("pending transaction failed to start", {StringField("error", resolved.ToString())});
    return resolved;
  }
  TXNSTAGE_LOG_DEBUG("transaction activated", {IntField("start_ts", static_cast<int64_t>(txn_.StartTS()))});
  return kv::Result::Ok();
}

kv::Result Session::CommitTxn(const kv::Context& ctx) {
  auto committed = txn_.Commit(ctx);
  dirty_db_.Clear();
  if (!committed) {
    binlog_.Clear();
  }
  return committed;
}

kv::Result Session::RollbackTxn() {
  auto rolled_back = txn_.Rollback();
  dirty_db_.Clear();
  binlog_.Clear();
  return rolled_back;
}

// ------------------------------------------------------------
// Statement boundary
// ------------------------------------------------------------

kv::Result Session::StmtCommit() {
  auto flushed = Flush();
  txn_.Cleanup();
  return flushed;
}

void Session::StmtRollback() {
  txn_.Cleanup();
}

kv::Result Session::Flush() {
  if (txn_.BufferLen() > 0) {
    if (txn_.IsPending()) {
      TXNSTAGE_RETURN_NOT_OK(ActivateTxn().Annotate("statement commit"));
    }
    auto* txn = txn_.Underlying();
    if (!txn) {
      return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "statement commit on " + txn_.DebugString());
    }

    std::size_t applied = 0;
    auto        walked  = kv::WalkMemBuffer(*txn_.buffer_, [&](const kv::Key& key, const kv::Value& value) -> kv::Result {
      if (faults_.fail_flush_after && applied >= *faults_.fail_flush_after) {
        return kv::Result::Err(kv::ErrorCode::UnderlyingStoreError, "injected statement flush failure");
      }
      auto written = kv::IsTombstone(value) ? txn->Delete(key) : txn->Set(key, value);
      if (!written) {
        return written.Annotate(kv::IsTombstone(value) ? "delete " + key : "set " + key);
      }
      ++applied;
      return kv::Result::Ok();
    });

    if (!walked) {
      auto fault = walked.Wrap(kv::ErrorCode::FlushFailure, "statement commit");
      // remaining entries are dropped; the transaction can only roll back now
      txn_.do_not_commit_ = fault;
      TXNSTAGE_LOG_WARN("statement flush failed, transaction marked do-not-commit",
                        {IntField("applied", static_cast<int64_t>(applied)), IntField("buffered", txn_.BufferLen()),
                         StringField("error", walked.ToString())});
      return fault;
    }
  }

  for (const auto& [table_id, delta] : txn_.mutations_) {
    binlog::MergeMutation(binlog_.Mutation(table_id), delta);
  }

  for (const auto& op : txn_.dirty_ops_) {
    dirty::MergeDirtyOperation(dirty_db_, op);
  }

  return kv::Result::Ok();
}

binlog::TableMutation& Session::StmtGetMutation(int64_t table_id) {
  return txn_.mutations_.GetOrCreate(table_id);
}

void Session::StmtAddDirtyTableOp(dirty::DirtyOpKind kind, int64_t table_id, int64_t handle, types::Row row) {
  txn_.dirty_ops_.push_back(dirty::DirtyTableOperation{kind, table_id, handle, std::move(row)});
}

} // namespace txnstage::session
