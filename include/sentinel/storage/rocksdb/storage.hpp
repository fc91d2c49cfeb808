#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/scale/ledger_rows.hpp>
#include <sentinel/schema/key/ledger_keys.hpp>
#include <sentinel/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace sentinel::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const sentinel::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(const std::string_view& str) {
  return ROCKSDB_NAMESPACE::Slice{str.data(), str.size()};
}

inline sentinel::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

inline sentinel::schema::bytes_view_t to_bytes_view(const std::string& str) {
  return {reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<sentinel::schema::registry_record_t> load_registry() const;
  sentinel::schema::amount_t load_supply() const;
  std::optional<sentinel::schema::amount_t> load_balance(
      const sentinel::schema::account_id_t& owner) const;
  std::vector<balance_entry_t> list_balances() const;
  sentinel::schema::event_head load_event_head() const;
  std::vector<sentinel::schema::ledger_event_t> load_events(
      sentinel::schema::sequence_t from_sequence,
      sentinel::schema::sequence_t to_sequence) const;
  void apply(const ledger_changeset& changeset) const;
  std::optional<uint64_t> load_counter(
      const sentinel::schema::bytes_view_t& key) const;
  void save_counter(const sentinel::schema::bytes_view_t& key,
                    uint64_t value) const;

 private:
  std::optional<std::string> get_raw(
      const ROCKSDB_NAMESPACE::Slice& key) const;
  void require_database() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_database() const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
}

inline std::optional<std::string> storage<rocksdb_storage_tag>::get_raw(
    const ROCKSDB_NAMESPACE::Slice& key) const {
  require_database();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key, &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    sentinel::common::critical("Failed to get value from RocksDB");
  }
  return value;
}

inline std::optional<sentinel::schema::registry_record_t>
storage<rocksdb_storage_tag>::load_registry() const {
  auto raw = get_raw(detail::to_slice(sentinel::schema::key::kRegistryKey));
  if (!raw) {
    return std::nullopt;
  }
  auto record = sentinel::schema::encoding::scale::decode_registry_record(
      detail::to_bytes_view(*raw));
  if (!record) {
    sentinel::common::critical("failed to decode registry record");
  }
  return record;
}

inline sentinel::schema::amount_t storage<rocksdb_storage_tag>::load_supply()
    const {
  auto raw = get_raw(detail::to_slice(sentinel::schema::key::kSupplyKey));
  if (!raw) {
    return 0;
  }
  auto supply = sentinel::schema::encoding::scale::decode_amount(
      detail::to_bytes_view(*raw));
  if (!supply) {
    sentinel::common::critical("failed to decode supply counter");
  }
  return *supply;
}

inline std::optional<sentinel::schema::amount_t>
storage<rocksdb_storage_tag>::load_balance(
    const sentinel::schema::account_id_t& owner) const {
  auto key = sentinel::schema::key::make_balance_key(owner);
  auto raw = get_raw(detail::to_slice(sentinel::schema::make_bytes_view(key)));
  if (!raw) {
    return std::nullopt;
  }
  auto balance = sentinel::schema::encoding::scale::decode_amount(
      detail::to_bytes_view(*raw));
  if (!balance) {
    sentinel::common::critical("failed to decode account balance");
  }
  return balance;
}

inline std::vector<balance_entry_t>
storage<rocksdb_storage_tag>::list_balances() const {
  require_database();
  auto entries = std::vector<balance_entry_t>{};
  auto prefix = sentinel::schema::key::kBalancePrefix;

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    auto owner = sentinel::schema::key::parse_balance_key(
        detail::to_bytes_view(iterator->key()));
    auto balance = sentinel::schema::encoding::scale::decode_amount(
        detail::to_bytes_view(iterator->value()));
    if (!owner || !balance) {
      sentinel::common::critical("failed to decode balance row");
    }
    entries.emplace_back(*owner, *balance);
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Balance scan failed: {}", iterator->status().ToString());
    sentinel::common::critical("failed to scan balances");
  }
  return entries;
}

inline sentinel::schema::event_head
storage<rocksdb_storage_tag>::load_event_head() const {
  auto raw = get_raw(detail::to_slice(sentinel::schema::key::kEventHeadKey));
  if (!raw) {
    return sentinel::schema::event_head{};
  }
  auto head = sentinel::schema::encoding::scale::decode_event_head(
      detail::to_bytes_view(*raw));
  if (!head) {
    sentinel::common::critical("failed to decode event head");
  }
  return *head;
}

inline std::vector<sentinel::schema::ledger_event_t>
storage<rocksdb_storage_tag>::load_events(
    const sentinel::schema::sequence_t from_sequence,
    const sentinel::schema::sequence_t to_sequence) const {
  require_database();
  auto events = std::vector<sentinel::schema::ledger_event_t>{};
  if (from_sequence > to_sequence) {
    return events;
  }

  auto start = sentinel::schema::key::make_event_key(from_sequence);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(sentinel::schema::make_bytes_view(start)));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(sentinel::schema::key::kEventPrefix)) {
      break;
    }
    auto event = sentinel::schema::encoding::scale::decode_ledger_event(
        detail::to_bytes_view(iterator->value()));
    if (!event) {
      sentinel::common::critical("failed to decode ledger event");
    }
    if (event->sequence > to_sequence) {
      break;
    }
    events.push_back(*event);
    iterator->Next();
  }
  return events;
}

inline void storage<rocksdb_storage_tag>::apply(
    const ledger_changeset& changeset) const {
  require_database();
  if (changeset.empty()) {
    return;
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto put = [&](const ROCKSDB_NAMESPACE::Slice& key,
                 const sentinel::schema::bytes_t& value) {
    auto status = batch.Put(
        key, detail::to_slice(sentinel::schema::make_bytes_view(value)));
    if (!status.ok()) {
      sentinel::common::critical("failed staging ledger write");
    }
  };

  if (changeset.registry) {
    put(detail::to_slice(sentinel::schema::key::kRegistryKey),
        sentinel::schema::encoding::scale::encode_row(*changeset.registry));
  }
  if (changeset.supply) {
    put(detail::to_slice(sentinel::schema::key::kSupplyKey),
        sentinel::schema::encoding::scale::encode_amount(*changeset.supply));
  }
  for (const auto& [owner, balance] : changeset.balances) {
    auto key = sentinel::schema::key::make_balance_key(owner);
    put(detail::to_slice(sentinel::schema::make_bytes_view(key)),
        sentinel::schema::encoding::scale::encode_amount(balance));
  }
  if (!changeset.events.empty()) {
    auto head = load_event_head();
    for (const auto& event : changeset.events) {
      if (event.sequence != head.count + 1) {
        sentinel::common::critical("event sequence is not contiguous");
      }
      auto encoded = sentinel::schema::encoding::scale::encode_row(event);
      auto key = sentinel::schema::key::make_event_key(event.sequence);
      put(detail::to_slice(sentinel::schema::make_bytes_view(key)), encoded);
      head.count = event.sequence;
      head.digest = sentinel::blake3::chain(
          head.digest, sentinel::schema::make_bytes_view(encoded));
    }
    put(detail::to_slice(sentinel::schema::key::kEventHeadKey),
        sentinel::schema::encoding::scale::encode_row(head));
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit ledger changeset: {}", status.ToString());
    sentinel::common::critical("failed to commit ledger changeset");
  }
}

inline std::optional<uint64_t> storage<rocksdb_storage_tag>::load_counter(
    const sentinel::schema::bytes_view_t& key) const {
  auto raw = get_raw(detail::to_slice(key));
  if (!raw) {
    return std::nullopt;
  }
  auto value = sentinel::schema::encoding::scale::decode_amount(
      detail::to_bytes_view(*raw));
  if (!value) {
    sentinel::common::critical("failed to decode host counter");
  }
  return value;
}

inline void storage<rocksdb_storage_tag>::save_counter(
    const sentinel::schema::bytes_view_t& key,
    const uint64_t value) const {
  require_database();
  auto encoded = sentinel::schema::encoding::scale::encode_amount(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(
      write_options, detail::to_slice(key),
      detail::to_slice(sentinel::schema::make_bytes_view(encoded)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    sentinel::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace sentinel::storage
