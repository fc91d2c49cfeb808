#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/encoding/scale/ledger_rows.hpp>

#include <string>
#include <tuple>

using namespace sentinel::schema;

namespace sentinel::schema::encoding::scale {

namespace {

using encoder_t = encoder<scale_encoder_tag>;

using registry_row_t =
    std::tuple<uint16_t, uint16_t, std::string, std::string, uint8_t, hash32_t>;
using event_row_t =
    std::tuple<uint16_t, uint64_t, uint8_t, hash32_t, hash32_t, uint64_t>;
using event_head_row_t = std::tuple<uint64_t, hash32_t>;

}  // namespace

bytes_t encode_row(const registry_record_t& record) {
  auto encoder = encoder_t{};
  return encoder.encode(registry_row_t{
      record.version, record.descriptor.version, record.descriptor.name,
      record.descriptor.symbol, record.descriptor.decimals, record.issuer});
}

std::optional<registry_record_t> decode_registry_record(
    const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<registry_row_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto& [version, descriptor_version, name, symbol, decimals, issuer] =
      decoded.value();
  if (version != 1 || descriptor_version != 1) {
    return std::nullopt;
  }
  auto record = registry_record_t{};
  record.descriptor.name = std::move(name);
  record.descriptor.symbol = std::move(symbol);
  record.descriptor.decimals = decimals;
  record.issuer = issuer;
  return record;
}

bytes_t encode_row(const ledger_event_t& event) {
  auto encoder = encoder_t{};
  return encoder.encode(event_row_t{
      event.version, event.sequence, static_cast<uint8_t>(event.kind),
      event.actor, event.counterparty, event.amount});
}

std::optional<ledger_event_t> decode_ledger_event(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<event_row_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  const auto& [version, sequence, kind, actor, counterparty, amount] =
      decoded.value();
  if (version != 1 || kind > static_cast<uint8_t>(event_kind_t::burn)) {
    return std::nullopt;
  }
  return ledger_event_t{.version = version,
                        .sequence = sequence,
                        .kind = static_cast<event_kind_t>(kind),
                        .actor = actor,
                        .counterparty = counterparty,
                        .amount = amount};
}

bytes_t encode_row(const event_head& head) {
  auto encoder = encoder_t{};
  return encoder.encode(event_head_row_t{head.count, head.digest});
}

std::optional<event_head> decode_event_head(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<event_head_row_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  return event_head{.count = std::get<0>(decoded.value()),
                    .digest = std::get<1>(decoded.value())};
}

bytes_t encode_amount(const amount_t amount) {
  auto encoder = encoder_t{};
  return encoder.encode(amount);
}

std::optional<amount_t> decode_amount(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  return encoder.try_decode<amount_t>(bytes);
}

}  // namespace sentinel::schema::encoding::scale
