#pragma once

#include <memory>

#include "internal/kv/kv.hpp"

namespace txnstage::kv {

/*
  Merged view of a write buffer over a snapshot.

  On equal keys the dirty entry wins. Dirty tombstones are skipped and
  also hide the snapshot entry they shadow.
*/
class UnionIter final : public Iterator {
  // only Make() can construct
  struct Token {
    explicit Token() = default;
  };

 public:
  static Result Make(std::unique_ptr<Iterator> dirty, std::unique_ptr<Iterator> snapshot, bool reverse, std::unique_ptr<Iterator>& out);

  UnionIter(Token, std::unique_ptr<Iterator> dirty, std::unique_ptr<Iterator> snapshot, bool reverse);

  bool         Valid() const override;
  const Key&   key() const override;
  const Value& value() const override;
  Result       Next() override;
  void         Close() override;

 private:
  Result DirtyNext();
  Result SnapshotNext();
  Result UpdateCur();

  std::unique_ptr<Iterator> dirty_;
  std::unique_ptr<Iterator> snapshot_;
  bool                      reverse_;

  bool cur_is_dirty_ = false;
  bool valid_        = true;
};

} // namespace txnstage::kv
