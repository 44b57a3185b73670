#pragma once

#include <string>

#include "config/v1/config.pb.h"
#include "internal/kv/mem_buffer.hpp"

namespace txnstage::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static txnstage::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

/*
  Transaction settings with defaults applied to unset fields.
*/
struct TxnSettings {
  kv::MemBufferOptions membuf;
  int                  txn_write_capacity = kv::kDefaultTxnMembufCap;
};

TxnSettings ResolveTxnSettings(const txnstage::runtime::config::RuntimeConfig& config);

} // namespace txnstage::config
