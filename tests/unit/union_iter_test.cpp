#include "internal/kv/union_iter.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/kv/mem_buffer.hpp"

namespace {

using txnstage::kv::Iterator;
using txnstage::kv::MemBuffer;
using txnstage::kv::UnionIter;

std::vector<std::string> Drain(Iterator& it) {
  std::vector<std::string> entries;
  while (it.Valid()) {
    entries.push_back(it.key() + "=" + it.value());
    assert(it.Next());
  }
  return entries;
}

void Fill(MemBuffer& dirty, MemBuffer& snapshot) {
  assert(snapshot.Set("a", "A"));
  assert(snapshot.Set("b", "B"));
  assert(snapshot.Set("c", "C"));
  assert(snapshot.Set("d", "D"));

  assert(dirty.Set("b", "B2"));
  assert(dirty.Delete("c"));
  assert(dirty.Set("e", "E"));
  assert(dirty.Delete("f"));
}

void TestForwardMergePrefersDirtyAndHidesTombstones() {
  MemBuffer dirty;
  MemBuffer snapshot;
  Fill(dirty, snapshot);

  std::unique_ptr<Iterator> dirty_it;
  std::unique_ptr<Iterator> snapshot_it;
  assert(dirty.Iter("", "", dirty_it));
  assert(snapshot.Iter("", "", snapshot_it));

  std::unique_ptr<Iterator> it;
  assert(UnionIter::Make(std::move(dirty_it), std::move(snapshot_it), false, it));
  assert((Drain(*it) == std::vector<std::string>{"a=A", "b=B2", "d=D", "e=E"}));
}

void TestReverseMerge() {
  MemBuffer dirty;
  MemBuffer snapshot;
  Fill(dirty, snapshot);

  std::unique_ptr<Iterator> dirty_it;
  std::unique_ptr<Iterator> snapshot_it;
  assert(dirty.IterReverse("", dirty_it));
  assert(snapshot.IterReverse("", snapshot_it));

  std::unique_ptr<Iterator> it;
  assert(UnionIter::Make(std::move(dirty_it), std::move(snapshot_it), true, it));
  assert((Drain(*it) == std::vector<std::string>{"e=E", "d=D", "b=B2", "a=A"}));
}

void TestOnlyTombstonesYieldsEmptyView() {
  MemBuffer dirty;
  MemBuffer snapshot;
  assert(snapshot.Set("x", "X"));
  assert(dirty.Delete("x"));
  assert(dirty.Delete("y"));

  std::unique_ptr<Iterator> dirty_it;
  std::unique_ptr<Iterator> snapshot_it;
  assert(dirty.Iter("", "", dirty_it));
  assert(snapshot.Iter("", "", snapshot_it));

  std::unique_ptr<Iterator> it;
  assert(UnionIter::Make(std::move(dirty_it), std::move(snapshot_it), false, it));
  assert(!it->Valid());
}

void TestCloseInvalidates() {
  MemBuffer dirty;
  MemBuffer snapshot;
  Fill(dirty, snapshot);

  std::unique_ptr<Iterator> dirty_it;
  std::unique_ptr<Iterator> snapshot_it;
  assert(dirty.Iter("", "", dirty_it));
  assert(snapshot.Iter("", "", snapshot_it));

  std::unique_ptr<Iterator> it;
  assert(UnionIter::Make(std::move(dirty_it), std::move(snapshot_it), false, it));
  assert(it->Valid());
  it->Close();
  assert(!it->Valid());
}

} // namespace

int main() {
  TestForwardMergePrefersDirtyAndHidesTombstones();
  TestReverseMerge();
  TestOnlyTombstonesYieldsEmptyView();
  TestCloseInvalidates();

  std::cout << "txnstage_unit_union_iter: pass\n";
  return 0;
}
