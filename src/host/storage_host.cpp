#include <spdlog/spdlog.h>
#include <sentinel/host/storage_host.hpp>
#include <sentinel/schema/key/ledger_keys.hpp>

#include <limits>

namespace sentinel::host {

storage_host::storage_host(const storage_t& storage) : storage_{storage} {}

uint64_t storage_host::activity_counter(
    const sentinel::schema::account_id_t& account) const {
  auto key = sentinel::schema::key::make_host_activity_key(account);
  return storage_.load_counter(sentinel::schema::make_bytes_view(key))
      .value_or(0);
}

sentinel::schema::amount_t storage_host::reference_balance(
    const sentinel::schema::account_id_t& account) const {
  auto key = sentinel::schema::key::make_host_reference_key(account);
  return storage_.load_counter(sentinel::schema::make_bytes_view(key))
      .value_or(0);
}

void storage_host::record_activity(
    const sentinel::schema::account_id_t& account) const {
  auto current = activity_counter(account);
  if (current == std::numeric_limits<uint64_t>::max()) {
    spdlog::warn("Activity counter of {} is saturated",
                 sentinel::schema::to_hex(account));
    return;
  }
  auto key = sentinel::schema::key::make_host_activity_key(account);
  storage_.save_counter(sentinel::schema::make_bytes_view(key), current + 1);
}

bool storage_host::set_activity_counter(
    const sentinel::schema::account_id_t& account,
    const uint64_t counter) const {
  auto current = activity_counter(account);
  if (counter < current) {
    spdlog::warn("Refusing to move activity counter of {} back from {} to {}",
                 sentinel::schema::to_hex(account), current, counter);
    return false;
  }
  auto key = sentinel::schema::key::make_host_activity_key(account);
  storage_.save_counter(sentinel::schema::make_bytes_view(key), counter);
  return true;
}

void storage_host::set_reference_balance(
    const sentinel::schema::account_id_t& account,
    const sentinel::schema::amount_t balance) const {
  auto key = sentinel::schema::key::make_host_reference_key(account);
  storage_.save_counter(sentinel::schema::make_bytes_view(key), balance);
}

}  // namespace sentinel::host
