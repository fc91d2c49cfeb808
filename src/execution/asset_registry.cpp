#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/execution/asset_registry.hpp>

#include <utility>

using sentinel::schema::ledger_error_code;

namespace sentinel::execution {

ledger_error_code asset_registry::initialize(
    const sentinel::schema::account_id_t& issuer,
    sentinel::schema::asset_descriptor_t descriptor) {
  if (initialized()) {
    return ledger_error_code::already_initialized;
  }
  load(sentinel::schema::registry_record_t{.descriptor = std::move(descriptor),
                                           .issuer = issuer});
  return ledger_error_code::ok;
}

void asset_registry::load(sentinel::schema::registry_record_t record) {
  if (initialized()) {
    sentinel::common::critical("asset registry loaded twice");
  }
  record_ = std::move(record);
  capabilities_ = capability_bundle::make();
  spdlog::debug("Asset registry holds '{}' ({}) with {} decimals",
                record_->descriptor.name, record_->descriptor.symbol,
                record_->descriptor.decimals);
}

const capability_bundle& asset_registry::capabilities() const {
  if (!capabilities_) {
    sentinel::common::critical("capabilities requested before initialization");
  }
  return *capabilities_;
}

const mint_capability* asset_registry::mint_capability_for(
    const sentinel::schema::account_id_t& caller) const {
  if (!record_ || caller != record_->issuer) {
    return nullptr;
  }
  return &capabilities().mint();
}

const burn_capability* asset_registry::burn_capability_for(
    const sentinel::schema::account_id_t& caller) const {
  if (!record_ || caller != record_->issuer) {
    return nullptr;
  }
  return &capabilities().burn();
}

}  // namespace sentinel::execution
