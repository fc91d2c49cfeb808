#pragma once
#include <sentinel/schema/asset_descriptor.hpp>
#include <sentinel/schema/ledger_event.hpp>
#include <sentinel/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace sentinel::storage {

using balance_entry_t =
    std::pair<sentinel::schema::account_id_t, sentinel::schema::amount_t>;

/// Everything one committed ledger operation writes. Applied as a single
/// atomic batch; a partially applied changeset is never observable.
struct ledger_changeset final {
  std::optional<sentinel::schema::registry_record_t> registry;
  std::optional<sentinel::schema::amount_t> supply;
  std::vector<balance_entry_t> balances;
  std::vector<sentinel::schema::ledger_event_t> events;

  bool empty() const {
    return !registry && !supply && balances.empty() && events.empty();
  }
};

template <typename Library>
struct storage {
  /// Load the one-time registry row, or std::nullopt before initialization.
  std::optional<sentinel::schema::registry_record_t> load_registry() const;

  /// Load the supply counter (zero when never written).
  sentinel::schema::amount_t load_supply() const;

  /// Load the balance of an account store, or std::nullopt when the store
  /// was never created.
  std::optional<sentinel::schema::amount_t> load_balance(
      const sentinel::schema::account_id_t& owner) const;

  /// Enumerate every account store in key order.
  std::vector<balance_entry_t> list_balances() const;

  /// Load the event log head (count + chained digest).
  sentinel::schema::event_head load_event_head() const;

  /// Return events with sequence in the inclusive range.
  std::vector<sentinel::schema::ledger_event_t> load_events(
      sentinel::schema::sequence_t from_sequence,
      sentinel::schema::sequence_t to_sequence) const;

  /// Atomically write a changeset and fold its events into the log head.
  void apply(const ledger_changeset& changeset) const;

  /// Raw counter access for host-owned tables living in the same database.
  std::optional<uint64_t> load_counter(
      const sentinel::schema::bytes_view_t& key) const;
  void save_counter(const sentinel::schema::bytes_view_t& key,
                    uint64_t value) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sentinel::storage
