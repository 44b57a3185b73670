#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "internal/types/datum.hpp"

namespace txnstage::dirty {

enum class DirtyOpKind : std::uint8_t {
  kAddRow    = 1,
  kDeleteRow = 2,
  kTruncate  = 3,
};

/*
  A row cache change recorded during a statement.

  Applied to the session's DirtyCache only when the statement commits.
*/
struct DirtyTableOperation {
  DirtyOpKind kind     = DirtyOpKind::kAddRow;
  int64_t     table_id = 0;
  int64_t     handle   = 0;
  types::Row  row;
};

/*
  Read-side cache of rows written by the running transaction.
*/
class DirtyCache {
 public:
  virtual ~DirtyCache() = default;

  virtual void AddRow(int64_t table_id, int64_t handle, const types::Row& row) = 0;
  virtual void DeleteRow(int64_t table_id, int64_t handle)                     = 0;
  virtual void TruncateTable(int64_t table_id)                                 = 0;
};

struct DirtyTable {
  std::unordered_map<int64_t, types::Row> added_rows;
  std::unordered_set<int64_t>             deleted_rows;
  bool                                    truncated = false;
};

/*
  Per-session dirty tables keyed by table id.
*/
class DirtyDB final : public DirtyCache {
 public:
  void AddRow(int64_t table_id, int64_t handle, const types::Row& row) override;
  void DeleteRow(int64_t table_id, int64_t handle) override;
  void TruncateTable(int64_t table_id) override;

  // nullptr when the table was never touched
  const DirtyTable* Table(int64_t table_id) const;

  bool Empty() const {
    return tables_.empty();
  }

  void Clear() {
    tables_.clear();
  }

 private:
  DirtyTable& Mutable(int64_t table_id);

  std::unordered_map<int64_t, DirtyTable> tables_;
};

// Dispatches a staged operation to the matching cache call.
void MergeDirtyOperation(DirtyCache& cache, const DirtyTableOperation& op);

} // namespace txnstage::dirty
