#pragma once

#include <cstdint>
#include <memory>

#include "internal/binlog/mutation_ledger.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/dirty/dirty_db.hpp"
#include "internal/kv/kv.hpp"
#include "internal/session/fault_injection.hpp"
#include "internal/session/txn_state.hpp"
#include "internal/types/datum.hpp"

namespace txnstage::session {

/*
  Statement and transaction boundaries of one client session.

  The statement driver calls StmtCommit() after a successful statement and
  StmtRollback() after a failed one. Only StmtCommit() moves buffered
  writes into the transaction and staged side effects into the session's
  binlog and dirty tables.
*/
class Session {
 public:
  Session(kv::Storage& storage, config::TxnSettings settings = {}, FaultInjection faults = {});

  // ------------------------------------------------------------------
  // Transaction boundary
  // ------------------------------------------------------------------
  /*
    Starts a lazy transaction: requests a start timestamp and moves the
    state to Pending. Session-wide binlog and dirty tables are reset.
  */
  kv::Result PrepareTxnFuture(const kv::Context& ctx);

  /*
    Makes the transaction usable, waiting for the start timestamp if it
    is still pending. No-op when already valid.
  */
  kv::Result ActivateTxn();

  kv::Result CommitTxn(const kv::Context& ctx);
  kv::Result RollbackTxn();

  TxnState& Txn() {
    return txn_;
  }
  const TxnState& Txn() const {
    return txn_;
  }

  // ------------------------------------------------------------------
  // Statement boundary
  // ------------------------------------------------------------------
  kv::Result StmtCommit();
  void       StmtRollback();

  // binlog delta of the running statement for a table
  binlog::TableMutation& StmtGetMutation(int64_t table_id);

  void StmtAddDirtyTableOp(dirty::DirtyOpKind kind, int64_t table_id, int64_t handle, types::Row row = {});

  // ------------------------------------------------------------------
  // Session-wide state
  // ------------------------------------------------------------------
  const binlog::PrewriteBinlog& Binlog() const {
    return binlog_;
  }
  const dirty::DirtyDB& DirtyTables() const {
    return dirty_db_;
  }

 private:
  kv::Result Flush();

  kv::Storage&           storage_;
  config::TxnSettings    settings_;
  FaultInjection         faults_;
  TxnState               txn_;
  binlog::PrewriteBinlog binlog_;
  dirty::DirtyDB         dirty_db_;
};

} // namespace txnstage::session
