#pragma once

#include <sentinel/schema/event_kind.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>

// Schema type: ledger event.
// Append-only record of a supply change. Observational only; the ledger never
// reads events back to make decisions.
namespace sentinel::schema {

template <uint16_t Version>
struct ledger_event;

template <>
struct ledger_event<1> final {
  uint16_t version{1};
  sequence_t sequence{};
  event_kind_t kind{event_kind_t::mint};
  account_id_t actor{};
  account_id_t counterparty{};
  amount_t amount{};
};

using ledger_event_t = ledger_event<1>;

inline bool operator==(const ledger_event_t& lhs, const ledger_event_t& rhs) {
  return lhs.version == rhs.version && lhs.sequence == rhs.sequence &&
         lhs.kind == rhs.kind && lhs.actor == rhs.actor &&
         lhs.counterparty == rhs.counterparty && lhs.amount == rhs.amount;
}

/// Head of the durable event log: number of events appended so far and the
/// BLAKE3 digest chained over all of them.
struct event_head final {
  sequence_t count{};
  hash32_t digest{};
};

}  // namespace sentinel::schema
