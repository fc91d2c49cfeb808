#pragma once
#include <sentinel/schema/asset_descriptor.hpp>
#include <sentinel/schema/ledger_event.hpp>
#include <sentinel/schema/primitives.hpp>

#include <optional>

// Row codecs for the values the ledger persists. Each row is laid out as a
// SCALE tuple of primitives so the wire form does not depend on struct
// layout.
namespace sentinel::schema::encoding::scale {

bytes_t encode_row(const registry_record_t& record);
std::optional<registry_record_t> decode_registry_record(
    const bytes_view_t& bytes);

bytes_t encode_row(const ledger_event_t& event);
std::optional<ledger_event_t> decode_ledger_event(const bytes_view_t& bytes);

bytes_t encode_row(const event_head& head);
std::optional<event_head> decode_event_head(const bytes_view_t& bytes);

bytes_t encode_amount(amount_t amount);
std::optional<amount_t> decode_amount(const bytes_view_t& bytes);

}  // namespace sentinel::schema::encoding::scale
