#include <sentinel/execution/working_set.hpp>

#include <iterator>
#include <utility>

namespace sentinel::execution {

working_set::working_set(const storage_t& storage,
                         const extend_capability& capability)
    : storage_{storage}, capability_{capability} {}

account_store& working_set::resolve(
    const sentinel::schema::account_id_t& owner) {
  auto existing = stores_.find(owner);
  if (existing != std::end(stores_)) {
    return existing->second;
  }
  auto balance = storage_.load_balance(owner).value_or(0);
  auto inserted = stores_.try_emplace(owner, owner, balance, capability_);
  return inserted.first->second;
}

sentinel::schema::amount_t working_set::supply() {
  if (!supply_) {
    supply_ = storage_.load_supply();
  }
  return *supply_;
}

void working_set::set_supply(const sentinel::schema::amount_t supply) {
  supply_ = supply;
  supply_dirty_ = true;
}

void working_set::emit(const sentinel::schema::event_kind_t kind,
                       const sentinel::schema::account_id_t& actor,
                       const sentinel::schema::account_id_t& counterparty,
                       const sentinel::schema::amount_t amount) {
  auto sequence = events_.empty() ? storage_.load_event_head().count + 1
                                  : events_.back().sequence + 1;
  events_.push_back(sentinel::schema::ledger_event_t{
      .sequence = sequence,
      .kind = kind,
      .actor = actor,
      .counterparty = counterparty,
      .amount = amount});
}

sentinel::storage::ledger_changeset working_set::into_changeset() && {
  auto changeset = sentinel::storage::ledger_changeset{};
  if (supply_dirty_) {
    changeset.supply = supply_;
  }
  changeset.balances.reserve(stores_.size());
  for (const auto& [owner, store] : stores_) {
    changeset.balances.emplace_back(owner, store.balance());
  }
  changeset.events = std::move(events_);
  return changeset;
}

}  // namespace sentinel::execution
