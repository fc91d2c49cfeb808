#pragma once

#include <sentinel/execution/account_store.hpp>
#include <sentinel/execution/capability.hpp>
#include <sentinel/schema/ledger_event.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <map>
#include <optional>
#include <vector>

namespace sentinel::execution {

using storage_t =
    sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>;

/// Per-operation overlay over committed state.
///
/// Stores are resolved (and created with the extend capability when absent)
/// into the overlay; nothing reaches storage until the owning operation turns
/// the overlay into a changeset. Dropping a working set is the rollback.
class working_set final {
 public:
  working_set(const storage_t& storage, const extend_capability& capability);
  working_set(const working_set&) = delete;
  working_set& operator=(const working_set&) = delete;
  working_set(working_set&&) = default;
  working_set& operator=(working_set&&) = delete;

  account_store& resolve(const sentinel::schema::account_id_t& owner);

  sentinel::schema::amount_t supply();
  void set_supply(sentinel::schema::amount_t supply);

  void emit(sentinel::schema::event_kind_t kind,
            const sentinel::schema::account_id_t& actor,
            const sentinel::schema::account_id_t& counterparty,
            sentinel::schema::amount_t amount);

  sentinel::storage::ledger_changeset into_changeset() &&;

 private:
  const storage_t& storage_;
  const extend_capability& capability_;
  std::map<sentinel::schema::account_id_t, account_store> stores_;
  std::optional<sentinel::schema::amount_t> supply_;
  bool supply_dirty_{false};
  std::vector<sentinel::schema::ledger_event_t> events_;
};

}  // namespace sentinel::execution
