#include <sentinel/schema/key/builder.hpp>
#include <sentinel/schema/key/ledger_keys.hpp>

#include <algorithm>

namespace sentinel::schema::key {

bytes_t make_balance_key(const account_id_t& owner) {
  auto key = builder{};
  key.write(kBalancePrefix).write(std::span{owner.data(), owner.size()});
  return std::move(key.data);
}

bytes_t make_event_key(const sequence_t sequence) {
  auto key = builder{};
  key.write(kEventPrefix).write(sequence);
  return std::move(key.data);
}

bytes_t make_host_activity_key(const account_id_t& account) {
  auto key = builder{};
  key.write(kHostActivityPrefix).write(std::span{account.data(), account.size()});
  return std::move(key.data);
}

bytes_t make_host_reference_key(const account_id_t& account) {
  auto key = builder{};
  key.write(kHostReferencePrefix)
      .write(std::span{account.data(), account.size()});
  return std::move(key.data);
}

std::optional<account_id_t> parse_balance_key(const bytes_view_t& key) {
  auto prefix = make_bytes_view(kBalancePrefix);
  if (key.size() != prefix.size() + account_id_t{}.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  return make_hash32(key.subspan(prefix.size()));
}

}  // namespace sentinel::schema::key
