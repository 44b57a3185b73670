#include <chrono>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/kv/memory/memory_storage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/session.hpp"

using txnstage::kv::Context;
using txnstage::kv::Result;
using txnstage::observability::IntField;
using txnstage::observability::StringField;
using txnstage::session::Session;

namespace {

int Fail(const std::string& step, const Result& result) {
  TXNSTAGE_LOG_ERROR("demo step failed", {StringField("step", step), StringField("error", result.ToString())});
  txnstage::observability::ShutdownLogging();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  txnstage::runtime::config::RuntimeConfig config;
  if (argc == 2) {
    try {
      config = txnstage::config::ConfigLoader::LoadFromYaml(argv[1]);
    } catch (const std::exception& e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  } else if (argc > 2) {
    std::cerr << "Usage: txnstage-demo [config.yaml]" << std::endl;
    return 1;
  }

  txnstage::observability::InitializeLogging(config);

  txnstage::config::TxnSettings settings;
  try {
    settings = txnstage::config::ResolveTxnSettings(config);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  txnstage::kv::memory::MemoryStorage storage;
  Session                             session(storage, settings);
  const auto                          ctx = Context::WithTimeout(std::chrono::seconds(5));

  if (auto r = session.PrepareTxnFuture(ctx); !r) return Fail("prepare", r);
  TXNSTAGE_LOG_INFO("transaction prepared", {StringField("txn", session.Txn().DebugString())});

  // ------------------------------------------------------------
  // Statement 1: insert two rows, committed
  // ------------------------------------------------------------
  if (auto r = session.ActivateTxn(); !r) return Fail("activate", r);
  if (auto r = session.Txn().Set("t1_r1", "alice"); !r) return Fail("set t1_r1", r);
  if (auto r = session.Txn().Set("t1_r2", "bob"); !r) return Fail("set t1_r2", r);
  session.StmtGetMutation(1).add_inserted_rows("alice");
  session.StmtGetMutation(1).add_inserted_rows("bob");
  session.StmtAddDirtyTableOp(txnstage::dirty::DirtyOpKind::kAddRow, 1, 1, {std::string("alice")});
  session.StmtAddDirtyTableOp(txnstage::dirty::DirtyOpKind::kAddRow, 1, 2, {std::string("bob")});
  TXNSTAGE_LOG_INFO("statement 1 buffered", {StringField("txn", session.Txn().DebugString())});
  if (auto r = session.StmtCommit(); !r) return Fail("statement 1 commit", r);

  // ------------------------------------------------------------
  // Statement 2: delete a row, rolled back
  // ------------------------------------------------------------
  if (auto r = session.Txn().Delete("t1_r1"); !r) return Fail("delete t1_r1", r);
  session.StmtGetMutation(1).add_deleted_ids(1);
  session.StmtAddDirtyTableOp(txnstage::dirty::DirtyOpKind::kDeleteRow, 1, 1);
  session.StmtRollback();

  std::string value;
  if (auto r = session.Txn().Get("t1_r1", value); !r) return Fail("get t1_r1", r);
  TXNSTAGE_LOG_INFO("read after statement rollback", {StringField("t1_r1", value)});

  const auto binlog_tables = session.Binlog().Value().mutations_size();
  if (auto r = session.CommitTxn(ctx); !r) return Fail("commit", r);

  TXNSTAGE_LOG_INFO("transaction committed",
                    {IntField("binlog_tables", binlog_tables), IntField("storage_commits", static_cast<int64_t>(storage.CommitCount())),
                     StringField("txn", session.Txn().DebugString())});

  std::cout << "t1_r1=" << storage.Read("t1_r1").value_or("<absent>") << " t1_r2=" << storage.Read("t1_r2").value_or("<absent>")
            << std::endl;

  txnstage::observability::ShutdownLogging();
  return 0;
}
