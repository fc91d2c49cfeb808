#pragma once

#include <sentinel/execution/capability.hpp>
#include <sentinel/schema/asset_descriptor.hpp>
#include <sentinel/schema/ledger_error_code.hpp>
#include <sentinel/schema/primitives.hpp>

#include <memory>
#include <optional>

namespace sentinel::execution {

class ledger;

/// Holds the asset descriptor, the issuer and the capability bundle of one
/// deployment. The bundle never leaves the registry; the ledger borrows it.
class asset_registry final {
 public:
  asset_registry() = default;
  asset_registry(const asset_registry&) = delete;
  asset_registry& operator=(const asset_registry&) = delete;

  bool initialized() const { return record_.has_value(); }
  const std::optional<sentinel::schema::registry_record_t>& record() const {
    return record_;
  }

  /// First-time initialization. Fails with `already_initialized` when a
  /// record is already held.
  sentinel::schema::ledger_error_code initialize(
      const sentinel::schema::account_id_t& issuer,
      sentinel::schema::asset_descriptor_t descriptor);

  /// Re-materialize an existing deployment at process start.
  void load(sentinel::schema::registry_record_t record);

 private:
  friend class ledger;

  const capability_bundle& capabilities() const;
  const mint_capability* mint_capability_for(
      const sentinel::schema::account_id_t& caller) const;
  const burn_capability* burn_capability_for(
      const sentinel::schema::account_id_t& caller) const;

  std::optional<sentinel::schema::registry_record_t> record_;
  std::unique_ptr<capability_bundle> capabilities_;
};

}  // namespace sentinel::execution
