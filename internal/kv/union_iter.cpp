#include "union_iter.hpp"

namespace txnstage::kv {

UnionIter::UnionIter(Token, std::unique_ptr<Iterator> dirty, std::unique_ptr<Iterator> snapshot, bool reverse)
    : dirty_(std::move(dirty)), snapshot_(std::move(snapshot)), reverse_(reverse) {
}

Result UnionIter::Make(std::unique_ptr<Iterator> dirty, std::unique_ptr<Iterator> snapshot, bool reverse, std::unique_ptr<Iterator>& out) {
  auto it = std::make_unique<UnionIter>(Token{}, std::move(dirty), std::move(snapshot), reverse);
  TXNSTAGE_RETURN_NOT_OK(it->UpdateCur().Annotate("union iterator init"));
  out = std::move(it);
  return Result::Ok();
}

Result UnionIter::DirtyNext() {
  return dirty_->Next().Annotate("write buffer iterator");
}

Result UnionIter::SnapshotNext() {
  return snapshot_->Next().Annotate("snapshot iterator");
}

// ------------------------------------------------------------
// Position on the next visible entry
// ------------------------------------------------------------

Result UnionIter::UpdateCur() {
  valid_ = true;
  for (;;) {
    const bool dirty_valid    = dirty_->Valid();
    const bool snapshot_valid = snapshot_->Valid();

    if (!dirty_valid && !snapshot_valid) {
      valid_ = false;
      return Result::Ok();
    }

    if (!dirty_valid) {
      cur_is_dirty_ = false;
      return Result::Ok();
    }

    if (!snapshot_valid) {
      cur_is_dirty_ = true;
      if (IsTombstone(dirty_->value())) {
        TXNSTAGE_RETURN_NOT_OK(DirtyNext());
        continue;
      }
      return Result::Ok();
    }

    int cmp = dirty_->key().compare(snapshot_->key());
    if (reverse_) {
      cmp = -cmp;
    }

    if (cmp == 0) {
      // dirty shadows snapshot
      if (IsTombstone(dirty_->value())) {
        TXNSTAGE_RETURN_NOT_OK(DirtyNext());
        TXNSTAGE_RETURN_NOT_OK(SnapshotNext());
        continue;
      }
      TXNSTAGE_RETURN_NOT_OK(SnapshotNext());
      cur_is_dirty_ = true;
      return Result::Ok();
    }

    if (cmp < 0) {
      cur_is_dirty_ = true;
      if (IsTombstone(dirty_->value())) {
        TXNSTAGE_RETURN_NOT_OK(DirtyNext());
        continue;
      }
      return Result::Ok();
    }

    cur_is_dirty_ = false;
    return Result::Ok();
  }
}

bool UnionIter::Valid() const {
  return valid_;
}

const Key& UnionIter::key() const {
  return cur_is_dirty_ ? dirty_->key() : snapshot_->key();
}

const Value& UnionIter::value() const {
  return cur_is_dirty_ ? dirty_->value() : snapshot_->value();
}

Result UnionIter::Next() {
  if (!valid_) {
    return Result::Ok();
  }
  TXNSTAGE_RETURN_NOT_OK(cur_is_dirty_ ? DirtyNext() : SnapshotNext());
  return UpdateCur();
}

void UnionIter::Close() {
  dirty_->Close();
  snapshot_->Close();
  valid_ = false;
}

} // namespace txnstage::kv
