#pragma once

#include <sentinel/execution/hooks.hpp>
#include <sentinel/execution/ledger.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/testing/common.hpp>
#include <sentinel/testing/memory_host.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sentinel::testing {

/// Temporary RocksDB database, an in-memory host and a ledger bound to them.
/// Standard hooks are used unless a hook set is supplied.
class ledger_fixture final {
 public:
  explicit ledger_fixture(
      const std::string_view db_prefix,
      std::optional<sentinel::execution::hook_set> hooks = std::nullopt)
      : db_path_{make_db_path(db_prefix)},
        storage_{sentinel::storage::make_storage<
            sentinel::storage::rocksdb_storage_tag>(db_path_)},
        hooks_{hooks ? std::move(*hooks)
                     : sentinel::execution::make_standard_hooks(host_)} {
    open();
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    ledger_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  memory_host& host() { return host_; }
  sentinel::execution::storage_t& storage() { return storage_; }
  sentinel::execution::ledger& ledger() { return *ledger_; }

  /// Drop the ledger and bind a fresh one to the same database, as a
  /// restarted process would.
  void reopen() {
    ledger_.reset();
    open();
  }

 private:
  void open() {
    ledger_ = std::make_unique<sentinel::execution::ledger>(storage_, hooks_);
  }

  std::string db_path_;
  memory_host host_;
  sentinel::execution::storage_t storage_;
  sentinel::execution::hook_set hooks_;
  std::unique_ptr<sentinel::execution::ledger> ledger_;
};

}  // namespace sentinel::testing
