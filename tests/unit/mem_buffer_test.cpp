#include "internal/kv/mem_buffer.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using txnstage::kv::ErrorCode;
using txnstage::kv::Iterator;
using txnstage::kv::Key;
using txnstage::kv::MemBuffer;
using txnstage::kv::MemBufferOptions;
using txnstage::kv::Result;
using txnstage::kv::Value;

std::vector<std::string> Drain(Iterator& it) {
  std::vector<std::string> keys;
  while (it.Valid()) {
    keys.push_back(it.key());
    assert(it.Next());
  }
  return keys;
}

void TestSetOverwriteTracksSize() {
  MemBuffer buffer;
  assert(buffer.Empty());

  assert(buffer.Set("k1", "v1"));
  assert(buffer.Set("k1", "value-2"));
  assert(buffer.Len() == 1);
  assert(buffer.Size() == std::string("k1").size() + std::string("value-2").size());

  Value value;
  assert(buffer.Get("k1", value));
  assert(value == "value-2");
}

void TestDeleteStoresTombstone() {
  MemBuffer buffer;
  assert(buffer.Set("k1", "v1"));
  assert(buffer.Delete("k1"));
  assert(buffer.Delete("never-set"));

  Value value = "stale";
  assert(buffer.Get("k1", value));
  assert(value.empty());
  assert(buffer.Len() == 2);

  assert(buffer.Get("missing", value).Is(ErrorCode::NotFound));
}

void TestSetEmptyValueRejected() {
  MemBuffer buffer;
  assert(buffer.Set("k1", "").Is(ErrorCode::EmptyValue));
  assert(buffer.Empty());
}

void TestEntryAndTotalLimits() {
  MemBufferOptions options;
  options.entry_size_limit = 8;
  options.total_size_limit = 14;
  MemBuffer buffer(options);

  assert(buffer.Set("key", "12345").code == ErrorCode::OK);
  assert(buffer.Set("key", "123456").Is(ErrorCode::EntryTooLarge));
  assert(buffer.Set("k2", "123").code == ErrorCode::OK);
  assert(buffer.Set("k3", "1234").Is(ErrorCode::TxnTooLarge));

  assert(buffer.Set("key", "1234567").Is(ErrorCode::EntryTooLarge));
  // overwriting an entry only counts the difference
  assert(buffer.Set("key", "1").Is(ErrorCode::OK));
  assert(buffer.Size() == 4 + 5);
}

void TestIterRangeAndReverse() {
  MemBuffer buffer;
  for (const auto* key : {"d", "a", "c", "b"}) {
    assert(buffer.Set(key, std::string("v") + key));
  }

  std::unique_ptr<Iterator> it;
  assert(buffer.Iter("b", "d", it));
  assert((Drain(*it) == std::vector<std::string>{"b", "c"}));

  assert(buffer.Iter("", "", it));
  assert((Drain(*it) == std::vector<std::string>{"a", "b", "c", "d"}));

  assert(buffer.IterReverse("c", it));
  assert((Drain(*it) == std::vector<std::string>{"b", "a"}));

  assert(buffer.IterReverse("", it));
  assert((Drain(*it) == std::vector<std::string>{"d", "c", "b", "a"}));

  assert(buffer.Iter("c", "b", it));
  assert(!it->Valid());
}

void TestWalkStopsAtFirstFailure() {
  MemBuffer buffer;
  assert(buffer.Set("a", "1"));
  assert(buffer.Delete("b"));
  assert(buffer.Set("c", "3"));

  std::vector<std::string> seen;
  auto                     walked = txnstage::kv::WalkMemBuffer(buffer, [&](const Key& key, const Value& value) {
    seen.push_back(key + "=" + value);
    if (key == "b") {
      return Result::Err(ErrorCode::UnderlyingStoreError, "stop");
    }
    return Result::Ok();
  });

  assert(walked.Is(ErrorCode::UnderlyingStoreError));
  assert((seen == std::vector<std::string>{"a=1", "b="}));
}

void TestResetKeepsLimits() {
  MemBufferOptions options;
  options.entry_size_limit = 4;
  MemBuffer buffer(options);

  assert(buffer.Set("a", "1"));
  buffer.Reset();
  assert(buffer.Empty());
  assert(buffer.Size() == 0);
  assert(buffer.Set("a", "12345").Is(ErrorCode::EntryTooLarge));
}

} // namespace

int main() {
  TestSetOverwriteTracksSize();
  TestDeleteStoresTombstone();
  TestSetEmptyValueRejected();
  TestEntryAndTotalLimits();
  TestIterRangeAndReverse();
  TestWalkStopsAtFirstFailure();
  TestResetKeepsLimits();

  std::cout << "txnstage_unit_mem_buffer: pass\n";
  return 0;
}
