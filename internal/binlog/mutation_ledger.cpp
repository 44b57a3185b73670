#include "mutation_ledger.hpp"

namespace txnstage::binlog {

TableMutation& MutationLedger::GetOrCreate(int64_t table_id) {
  auto [it, inserted] = mutations_.try_emplace(table_id);
  if (inserted) {
    it->second.set_table_id(table_id);
  }
  return it->second;
}

TableMutation& PrewriteBinlog::Mutation(int64_t table_id) {
  for (auto& mutation : *value_.mutable_mutations()) {
    if (mutation.table_id() == table_id) {
      return mutation;
    }
  }
  auto* mutation = value_.add_mutations();
  mutation->set_table_id(table_id);
  return *mutation;
}

void MergeMutation(TableMutation& dst, const TableMutation& src) {
  // RepeatedField::MergeFrom appends
  dst.mutable_inserted_rows()->MergeFrom(src.inserted_rows());
  dst.mutable_updated_rows()->MergeFrom(src.updated_rows());
  dst.mutable_deleted_ids()->MergeFrom(src.deleted_ids());
  dst.mutable_deleted_pks()->MergeFrom(src.deleted_pks());
  dst.mutable_deleted_rows()->MergeFrom(src.deleted_rows());
  dst.mutable_sequence()->MergeFrom(src.sequence());
}

} // namespace txnstage::binlog
