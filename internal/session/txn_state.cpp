#include "txn_state.hpp"

#include <sstream>

#include "internal/kv/union_iter.hpp"
#include "internal/observability/logging.hpp"

namespace txnstage::session {

using txnstage::observability::IntField;
using txnstage::observability::StringField;

namespace {

std::string DescribeMutations(const binlog::MutationLedger& mutations) {
  std::ostringstream out;
  out << "[";
  bool first = true;
  for (const auto& [table_id, mutation] : mutations) {
    if (!first) {
      out << "; ";
    }
    first = false;
    out << mutation.ShortDebugString();
  }
  out << "]";
  return out.str();
}

const char* DirtyOpName(dirty::DirtyOpKind kind) {
  switch (kind) {
    case dirty::DirtyOpKind::kAddRow:
      return "add";
    case dirty::DirtyOpKind::kDeleteRow:
      return "delete";
    case dirty::DirtyOpKind::kTruncate:
      return "truncate";
  }
  return "unknown";
}

std::string DescribeDirtyOps(const std::vector<dirty::DirtyTableOperation>& ops) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < ops.size(); ++i) {
    if (i > 0) {
      out << " ";
    }
    out << DirtyOpName(ops[i].kind) << "(table=" << ops[i].table_id << ",handle=" << ops[i].handle << ")";
  }
  out << "]";
  return out.str();
}

} // namespace

TxnState::TxnState(kv::MemBufferOptions options) : options_(options) {
}

void TxnState::Init() {
  if (!buffer_) {
    buffer_ = std::make_unique<kv::MemBuffer>(options_);
  }
}

// ------------------------------------------------------------
// Phase queries
// ------------------------------------------------------------

bool TxnState::Valid() const {
  auto* active = std::get_if<Active>(&phase_);
  return active && active->txn && active->txn->Valid();
}

bool TxnState::IsPending() const {
  return std::holds_alternative<Pending>(phase_);
}

bool TxnState::ValidOrPending() const {
  return IsPending() || Valid();
}

kv::Transaction* TxnState::Underlying() const {
  auto* active = std::get_if<Active>(&phase_);
  return active ? active->txn.get() : nullptr;
}

uint64_t TxnState::StartTS() const {
  return Valid() ? Underlying()->StartTS() : 0;
}

int TxnState::BufferLen() const {
  return buffer_ ? buffer_->Len() : 0;
}

bool TxnState::Dirty() const {
  return BufferLen() != 0 || !mutations_.Empty() || !dirty_ops_.empty();
}

// ------------------------------------------------------------
// Phase transitions
// ------------------------------------------------------------

kv::Result TxnState::MakePending(std::unique_ptr<TxnFuture> future) {
  if (!future) {
    return kv::Result::Err(kv::ErrorCode::FutureNotSet, "make pending without a future");
  }
  if (ValidOrPending()) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "make pending on " + DebugString());
  }
  Init();
  phase_ = Pending{std::move(future)};
  return kv::Result::Ok();
}

kv::Result TxnState::MakeValid(std::unique_ptr<kv::Transaction> txn) {
  if (!txn) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "make valid without a transaction");
  }
  if (ValidOrPending()) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "make valid on " + DebugString());
  }
  Init();
  Adopt(std::move(txn));
  return kv::Result::Ok();
}

void TxnState::Adopt(std::unique_ptr<kv::Transaction> txn) {
  Active active;
  active.assumptions = dynamic_cast<kv::AssumptionStore*>(txn.get());
  active.txn         = std::move(txn);
  phase_             = std::move(active);
}

kv::Result TxnState::ResolvePending(int txn_cap) {
  auto* pending = std::get_if<Pending>(&phase_);
  if (!pending) {
    return kv::Result::Err(kv::ErrorCode::FutureNotSet, "transaction future is not set");
  }

  // the future is consumed whatever the outcome
  auto future = std::move(pending->future);
  phase_      = Invalid{};

  std::unique_ptr<kv::Transaction> txn;
  auto                             waited = future->Wait(txn);
  if (!waited) {
    return waited.Annotate("resolve pending transaction");
  }
  txn->SetCap(txn_cap);
  Adopt(std::move(txn));
  return kv::Result::Ok();
}

void TxnState::Invalidate() {
  phase_ = Invalid{};
}

void TxnState::Cleanup() {
  if (buffer_) {
    buffer_->Reset();
  }
  mutations_.Clear();
  dirty_ops_.clear();
}

void TxnState::Reset() {
  do_not_commit_ = kv::Result::Ok();
  Cleanup();
  Invalidate();
}

// ------------------------------------------------------------
// Reads: write buffer first, then the transaction
// ------------------------------------------------------------

kv::Result TxnState::Get(const kv::Key& key, kv::Value& out) {
  if (!buffer_) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "get outside a transaction");
  }

  kv::Value value;
  auto      buffered = buffer_->Get(key, value);
  if (buffered.Is(kv::ErrorCode::NotFound)) {
    auto* txn = Underlying();
    if (!txn) {
      return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "get on " + DebugString());
    }
    auto fetched = txn->Get(key, value);
    if (fetched.Is(kv::ErrorCode::NotFound)) {
      return fetched;
    }
    if (!fetched) {
      return fetched.Annotate("get " + key);
    }
  } else if (!buffered) {
    return buffered.Annotate("get " + key + " from write buffer");
  }

  if (kv::IsTombstone(value)) {
    return kv::Result::Err(kv::ErrorCode::NotFound, "key deleted in statement");
  }
  out = std::move(value);
  return kv::Result::Ok();
}

kv::Result TxnState::Iter(const kv::Key& lower, const kv::Key& upper, std::unique_ptr<kv::Iterator>& out) {
  auto* txn = Underlying();
  if (!buffer_ || !txn) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "iterate on " + DebugString());
  }

  std::unique_ptr<kv::Iterator> buffer_it;
  TXNSTAGE_RETURN_NOT_OK(buffer_->Iter(lower, upper, buffer_it).Annotate("write buffer iterator"));

  std::unique_ptr<kv::Iterator> txn_it;
  TXNSTAGE_RETURN_NOT_OK(txn->Iter(lower, upper, txn_it).Annotate("transaction iterator"));

  return kv::UnionIter::Make(std::move(buffer_it), std::move(txn_it), false, out);
}

kv::Result TxnState::IterReverse(const kv::Key& upper, std::unique_ptr<kv::Iterator>& out) {
  auto* txn = Underlying();
  if (!buffer_ || !txn) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "reverse iterate on " + DebugString());
  }

  std::unique_ptr<kv::Iterator> buffer_it;
  TXNSTAGE_RETURN_NOT_OK(buffer_->IterReverse(upper, buffer_it).Annotate("write buffer reverse iterator"));

  std::unique_ptr<kv::Iterator> txn_it;
  TXNSTAGE_RETURN_NOT_OK(txn->IterReverse(upper, txn_it).Annotate("transaction reverse iterator"));

  return kv::UnionIter::Make(std::move(buffer_it), std::move(txn_it), true, out);
}

// ------------------------------------------------------------
// Writes never reach the transaction directly
// ------------------------------------------------------------

kv::Result TxnState::Set(const kv::Key& key, const kv::Value& value) {
  if (!buffer_ || std::holds_alternative<Invalid>(phase_)) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "set outside a transaction");
  }
  return buffer_->Set(key, value);
}

kv::Result TxnState::Delete(const kv::Key& key) {
  if (!buffer_ || std::holds_alternative<Invalid>(phase_)) {
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "delete outside a transaction");
  }
  return buffer_->Delete(key);
}

void TxnState::SetAssumption(const kv::Key& key, kv::AssumptionType assumption) {
  auto* active = std::get_if<Active>(&phase_);
  if (active && active->assumptions) {
    active->assumptions->SetAssumption(key, assumption);
  }
}

// ------------------------------------------------------------
// Commit / Rollback
// ------------------------------------------------------------

kv::Result TxnState::Commit(const kv::Context& ctx) {
  if (Dirty()) {
    // statement boundaries must have drained everything
    TXNSTAGE_LOG_ERROR("commit with undrained statement state, statement protocol violated",
                       {StringField("txn", DebugString()), IntField("buffer_len", BufferLen()),
                        IntField("mutations", static_cast<int64_t>(mutations_.Size())),
                        IntField("dirty_ops", static_cast<int64_t>(dirty_ops_.size())),
                        StringField("mutation_dump", DescribeMutations(mutations_)),
                        StringField("dirty_op_dump", DescribeDirtyOps(dirty_ops_))});
    Reset();
    return kv::Result::Err(kv::ErrorCode::InternalInconsistency, "invalid transaction: statement buffers not empty at commit");
  }

  auto* txn = Underlying();
  if (!txn) {
    const bool pending = IsPending();
    const auto state   = DebugString();
    Reset();
    if (pending) {
      // never activated, so nothing was written
      return kv::Result::Ok();
    }
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "commit on " + state);
  }

  if (!do_not_commit_) {
    auto fault = do_not_commit_;
    if (auto rolled_back = txn->Rollback(); !rolled_back) {
      TXNSTAGE_LOG_ERROR("rollback of poisoned transaction failed", {StringField("error", rolled_back.ToString())});
    }
    Reset();
    return fault;
  }

  auto committed = txn->Commit(ctx);
  Reset();
  if (!committed) {
    TXNSTAGE_LOG_WARN("transaction commit failed", {StringField("error", committed.ToString())});
    return committed.Annotate("commit");
  }
  return kv::Result::Ok();
}

kv::Result TxnState::Rollback() {
  auto* txn = Underlying();
  if (!txn) {
    const bool pending = IsPending();
    Reset();
    if (pending) {
      // nothing was begun, dropping the future is enough
      return kv::Result::Ok();
    }
    return kv::Result::Err(kv::ErrorCode::InvalidTxnState, "rollback outside a transaction");
  }

  auto rolled_back = txn->Rollback();
  Reset();
  return rolled_back.Annotate("rollback");
}

// ------------------------------------------------------------
// Diagnostics
// ------------------------------------------------------------

std::string TxnState::String() const {
  if (auto* txn = Underlying()) {
    return txn->String();
  }
  if (IsPending()) {
    return "txnFuture";
  }
  return "invalid transaction";
}

std::string TxnState::DebugString() const {
  std::ostringstream out;
  out << "Txn{";
  if (IsPending()) {
    out << "state=pending";
  } else if (Valid()) {
    out << "state=valid";
    out << ", startTS=" << Underlying()->StartTS();
    if (BufferLen() > 0) {
      out << ", len(buffer)=" << BufferLen();
    }
    if (!dirty_ops_.empty()) {
      out << ", len(dirtyTable)=" << dirty_ops_.size();
    }
    if (!mutations_.Empty()) {
      out << ", len(mutations)=" << mutations_.Size();
    }
    if (!do_not_commit_) {
      out << ", doNotCommit=" << do_not_commit_.ToString();
    }
  } else {
    out << "state=invalid";
  }
  out << "}";
  return out.str();
}

} // namespace txnstage::session
