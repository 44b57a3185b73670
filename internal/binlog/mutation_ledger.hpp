#pragma once

#include <cstdint>
#include <unordered_map>

#include "binlog/v1/binlog.pb.h"

namespace txnstage::binlog {

using TableMutation = txnstage::binlog::v1::TableMutation;
using PrewriteValue = txnstage::binlog::v1::PrewriteValue;

/*
  Statement-scoped binlog deltas, one TableMutation per table id.
*/
class MutationLedger {
 public:
  using Map = std::unordered_map<int64_t, TableMutation>;

  TableMutation& GetOrCreate(int64_t table_id);

  bool Empty() const {
    return mutations_.empty();
  }
  std::size_t Size() const {
    return mutations_.size();
  }

  void Clear() {
    mutations_.clear();
  }

  Map::const_iterator begin() const {
    return mutations_.begin();
  }
  Map::const_iterator end() const {
    return mutations_.end();
  }

 private:
  Map mutations_;
};

/*
  Session-wide binlog prewrite value.

  Statement ledgers are merged into it on statement commit.
*/
class PrewriteBinlog {
 public:
  // Finds the table's mutation, appending a new one if absent.
  TableMutation& Mutation(int64_t table_id);

  const PrewriteValue& Value() const {
    return value_;
  }

  void SetSchemaVersion(int64_t version) {
    value_.set_schema_version(version);
  }

  void Clear() {
    value_.Clear();
  }

 private:
  PrewriteValue value_;
};

// Appends every row-delta field of src to dst, keeping per-field order.
void MergeMutation(TableMutation& dst, const TableMutation& src);

} // namespace txnstage::binlog
