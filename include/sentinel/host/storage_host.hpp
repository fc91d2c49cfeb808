#pragma once

#include <sentinel/execution/host.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <cstdint>

namespace sentinel::host {

/// Reference host oracles backed by host-owned tables in the ledger database.
///
/// Activity counters only move forward; the host bumps the caller's counter
/// after each committed operation. The bump is a separate synced write, so a
/// crash between the ledger commit and the bump leaves that operation
/// uncounted. Counters can only lag, never run ahead of committed work.
class storage_host final : public sentinel::execution::host_interface {
 public:
  using storage_t =
      sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>;

  explicit storage_host(const storage_t& storage);

  uint64_t activity_counter(
      const sentinel::schema::account_id_t& account) const override;
  sentinel::schema::amount_t reference_balance(
      const sentinel::schema::account_id_t& account) const override;

  /// Record one committed transaction of `account`.
  void record_activity(const sentinel::schema::account_id_t& account) const;

  /// Raise the activity counter to `counter`. Returns false, leaving the
  /// counter untouched, when that would move it backwards.
  bool set_activity_counter(const sentinel::schema::account_id_t& account,
                            uint64_t counter) const;

  void set_reference_balance(const sentinel::schema::account_id_t& account,
                             sentinel::schema::amount_t balance) const;

 private:
  const storage_t& storage_;
};

}  // namespace sentinel::host
