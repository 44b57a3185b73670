#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using txnstage::config::ConfigLoader;
using txnstage::config::ResolveTxnSettings;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "txnstage_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestLoadsLoggingAndTxnSections() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
  pattern: "[%l] %v"
txn:
  entry_size_limit: 1024
  total_size_limit: 65536
  txn_write_capacity: 16
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.txn().entry_size_limit() == 1024);

  auto settings = ResolveTxnSettings(config);
  assert(settings.membuf.entry_size_limit == 1024);
  assert(settings.membuf.total_size_limit == 65536);
  assert(settings.txn_write_capacity == 16);
}

void TestEmptyFileSelectsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config   = ConfigLoader::LoadFromYaml(yaml_path.string());
  auto settings = ResolveTxnSettings(config);
  assert(settings.membuf.entry_size_limit == txnstage::kv::kDefaultEntrySizeLimit);
  assert(settings.membuf.total_size_limit == txnstage::kv::kDefaultTotalSizeLimit);
  assert(settings.txn_write_capacity == txnstage::kv::kDefaultTxnMembufCap);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(txn:
  entry_size_limit: 10
  membuf_capacity: 32
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEntryLimitAboveTotalIsRejected() {
  const auto yaml_path = WriteYaml("entry_above_total",
                                   R"(txn:
  entry_size_limit: 4096
  total_size_limit: 1024
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  bool threw = false;
  try {
    (void)ResolveTxnSettings(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/txnstage.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoadsLoggingAndTxnSections();
  TestEmptyFileSelectsDefaults();
  TestUnknownFieldsAreRejected();
  TestEntryLimitAboveTotalIsRejected();
  TestMissingFileThrows();

  std::cout << "txnstage_unit_config_loader: pass\n";
  return 0;
}
