#include "mem_buffer.hpp"

#include <string>

namespace txnstage::kv {

namespace {

using EntryMap = std::map<Key, Value>;

class ForwardIterator final : public Iterator {
 public:
  ForwardIterator(EntryMap::const_iterator begin, EntryMap::const_iterator end) : it_(begin), end_(end) {
  }

  bool Valid() const override {
    return it_ != end_;
  }
  const Key& key() const override {
    return it_->first;
  }
  const Value& value() const override {
    return it_->second;
  }
  Result Next() override {
    if (it_ != end_) ++it_;
    return Result::Ok();
  }
  void Close() override {
    it_ = end_;
  }

 private:
  EntryMap::const_iterator it_;
  EntryMap::const_iterator end_;
};

class ReverseIterator final : public Iterator {
 public:
  ReverseIterator(EntryMap::const_reverse_iterator begin, EntryMap::const_reverse_iterator end) : it_(begin), end_(end) {
  }

  bool Valid() const override {
    return it_ != end_;
  }
  const Key& key() const override {
    return it_->first;
  }
  const Value& value() const override {
    return it_->second;
  }
  Result Next() override {
    if (it_ != end_) ++it_;
    return Result::Ok();
  }
  void Close() override {
    it_ = end_;
  }

 private:
  EntryMap::const_reverse_iterator it_;
  EntryMap::const_reverse_iterator end_;
};

} // namespace

MemBuffer::MemBuffer(MemBufferOptions options) : options_(options) {
}

Result MemBuffer::Get(const Key& key, Value& out) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result::Err(ErrorCode::NotFound, "key not in write buffer");
  }
  out = it->second;
  return Result::Ok();
}

Result MemBuffer::Iter(const Key& lower, const Key& upper, std::unique_ptr<Iterator>& out) {
  auto begin = entries_.lower_bound(lower);
  auto end   = upper.empty() ? entries_.end() : entries_.lower_bound(upper);
  if (!upper.empty() && upper < lower) {
    end = begin;
  }
  out = std::make_unique<ForwardIterator>(begin, end);
  return Result::Ok();
}

Result MemBuffer::IterReverse(const Key& upper, std::unique_ptr<Iterator>& out) {
  auto start = upper.empty() ? entries_.end() : entries_.lower_bound(upper);
  out        = std::make_unique<ReverseIterator>(EntryMap::const_reverse_iterator(start), entries_.crend());
  return Result::Ok();
}

Result MemBuffer::Set(const Key& key, const Value& value) {
  if (value.empty()) {
    return Result::Err(ErrorCode::EmptyValue, "cannot set empty value for key " + key);
  }
  return Put(key, value);
}

Result MemBuffer::Delete(const Key& key) {
  return Put(key, Value{});
}

Result MemBuffer::Put(const Key& key, const Value& value) {
  const uint64_t entry_size = key.size() + value.size();
  if (entry_size > options_.entry_size_limit) {
    return Result::Err(ErrorCode::EntryTooLarge,
                       "entry size " + std::to_string(entry_size) + " exceeds limit " + std::to_string(options_.entry_size_limit));
  }

  auto     it       = entries_.find(key);
  uint64_t new_size = size_ + entry_size;
  if (it != entries_.end()) {
    new_size -= it->first.size() + it->second.size();
  }
  if (new_size > options_.total_size_limit) {
    return Result::Err(ErrorCode::TxnTooLarge,
                       "write buffer size " + std::to_string(new_size) + " exceeds limit " + std::to_string(options_.total_size_limit));
  }

  if (it == entries_.end()) {
    entries_.emplace(key, value);
  } else {
    it->second = value;
  }
  size_ = new_size;
  return Result::Ok();
}

void MemBuffer::Reset() {
  entries_.clear();
  size_ = 0;
}

Result WalkMemBuffer(const MemBuffer& buffer, const std::function<Result(const Key&, const Value&)>& fn) {
  for (const auto& [key, value] : buffer.entries_) {
    TXNSTAGE_RETURN_NOT_OK(fn(key, value));
  }
  return Result::Ok();
}

} // namespace txnstage::kv
