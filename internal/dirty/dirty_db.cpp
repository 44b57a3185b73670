#include "dirty_db.hpp"

namespace txnstage::dirty {

DirtyTable& DirtyDB::Mutable(int64_t table_id) {
  return tables_[table_id];
}

const DirtyTable* DirtyDB::Table(int64_t table_id) const {
  auto it = tables_.find(table_id);
  if (it == tables_.end()) return nullptr;
  return &it->second;
}

void DirtyDB::AddRow(int64_t table_id, int64_t handle, const types::Row& row) {
  auto& table              = Mutable(table_id);
  table.added_rows[handle] = row;
}

void DirtyDB::DeleteRow(int64_t table_id, int64_t handle) {
  auto& table = Mutable(table_id);
  table.added_rows.erase(handle);
  table.deleted_rows.insert(handle);
}

void DirtyDB::TruncateTable(int64_t table_id) {
  auto& table = Mutable(table_id);
  table.added_rows.clear();
  table.deleted_rows.clear();
  table.truncated = true;
}

void MergeDirtyOperation(DirtyCache& cache, const DirtyTableOperation& op) {
  switch (op.kind) {
    case DirtyOpKind::kAddRow:
      cache.AddRow(op.table_id, op.handle, op.row);
      break;
    case DirtyOpKind::kDeleteRow:
      cache.DeleteRow(op.table_id, op.handle);
      break;
    case DirtyOpKind::kTruncate:
      cache.TruncateTable(op.table_id);
      break;
  }
}

} // namespace txnstage::dirty
