#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/execution/ledger.hpp>

#include <limits>
#include <string>
#include <utility>

using namespace sentinel::schema;

namespace {

constexpr auto kInitializeCodespace = std::string_view{"sentinel.initialize"};
constexpr auto kMintCodespace = std::string_view{"sentinel.mint"};
constexpr auto kBurnCodespace = std::string_view{"sentinel.burn"};
constexpr auto kTransferCodespace = std::string_view{"sentinel.transfer"};

std::string_view describe(const ledger_error_code code) {
  switch (code) {
    case ledger_error_code::ok:
      return "accepted";
    case ledger_error_code::already_initialized:
      return "asset already registered for this deployment";
    case ledger_error_code::unauthorized:
      return "caller does not hold the required capability";
    case ledger_error_code::inactive_account:
      return "account has no committed transactions on the host";
    case ledger_error_code::cap_exceeded:
      return "balance does not exceed the proportional withdraw cap";
    case ledger_error_code::minimum_balance_not_met:
      return "reference currency balance is at or below the floor";
    case ledger_error_code::insufficient_balance:
      return "amount exceeds balance";
    case ledger_error_code::overflow:
      return "supply or balance would overflow";
    case ledger_error_code::not_initialized:
      return "asset is not registered";
  }
  return "unknown";
}

operation_result_t reject(const std::string_view codespace,
                          const ledger_error_code code,
                          const std::string_view gate = {}) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = gate.empty() ? std::string{describe(code)}
                             : std::string{gate} + ": " +
                                   std::string{describe(code)};
  result.codespace = std::string{codespace};
  spdlog::debug("{} rejected: {}", codespace, result.info);
  return result;
}

bool adds_overflow(const amount_t lhs, const amount_t rhs) {
  return std::numeric_limits<amount_t>::max() - lhs < rhs;
}

}  // namespace

namespace sentinel::execution {

ledger::ledger(storage_t& storage, hook_set hooks)
    : storage_{storage}, dispatcher_{std::move(hooks)} {
  if (auto record = storage_.load_registry()) {
    registry_.load(std::move(*record));
    spdlog::info("Ledger opened for asset '{}' with supply {}",
                 registry_.record()->descriptor.symbol, storage_.load_supply());
  } else {
    spdlog::info("Ledger opened; asset not yet registered");
  }
}

operation_result_t ledger::initialize(const account_id_t& issuer,
                                      std::string name,
                                      std::string symbol,
                                      const uint8_t decimals) {
  if (registry_.initialized() || storage_.load_registry()) {
    return reject(kInitializeCodespace, ledger_error_code::already_initialized);
  }
  auto code = registry_.initialize(
      issuer, asset_descriptor_t{.name = std::move(name),
                                 .symbol = std::move(symbol),
                                 .decimals = decimals});
  if (code != ledger_error_code::ok) {
    return reject(kInitializeCodespace, code);
  }

  auto changeset = sentinel::storage::ledger_changeset{};
  changeset.registry = registry_.record();
  changeset.supply = amount_t{0};
  storage_.apply(changeset);

  spdlog::info("Registered asset '{}' ({}) with {} decimals, issuer {}",
               registry_.record()->descriptor.name,
               registry_.record()->descriptor.symbol, decimals, to_hex(issuer));
  auto result = operation_result_t{};
  result.codespace = std::string{kInitializeCodespace};
  result.info = "asset registered";
  return result;
}

operation_result_t ledger::mint(const account_id_t& caller,
                                const account_id_t& to,
                                const amount_t amount) {
  if (!registry_.initialized()) {
    return reject(kMintCodespace, ledger_error_code::not_initialized);
  }
  const auto* capability = registry_.mint_capability_for(caller);
  if (capability == nullptr) {
    return reject(kMintCodespace, ledger_error_code::unauthorized,
                  "mint capability");
  }

  auto set = working_set{storage_, registry_.capabilities().extend()};
  auto supply = set.supply();
  auto& store = set.resolve(to);
  if (adds_overflow(supply, amount) || adds_overflow(store.balance(), amount)) {
    return reject(kMintCodespace, ledger_error_code::overflow);
  }

  store.deposit(fungible_amount::mint(amount, *capability), *capability);
  set.set_supply(supply + amount);
  set.emit(event_kind_t::mint, caller, to, amount);
  return commit(std::move(set), kMintCodespace, "minted");
}

operation_result_t ledger::burn(const account_id_t& caller,
                                const account_id_t& from,
                                const amount_t amount) {
  if (!registry_.initialized()) {
    return reject(kBurnCodespace, ledger_error_code::not_initialized);
  }
  const auto* capability = registry_.burn_capability_for(caller);
  if (capability == nullptr) {
    return reject(kBurnCodespace, ledger_error_code::unauthorized,
                  "burn capability");
  }

  const auto& capabilities = registry_.capabilities();
  auto set = working_set{storage_, capabilities.extend()};
  auto& store = set.resolve(from);
  auto error = ledger_error_code::ok;
  auto withdrawn =
      dispatcher_.withdraw(store, amount, capabilities.transfer(), error);
  if (!withdrawn) {
    return reject(kBurnCodespace, error, "withdraw gate");
  }

  auto supply = set.supply();
  if (withdrawn->value() > supply) {
    sentinel::common::critical("burn exceeds total supply");
  }
  auto burned = fungible_amount::burn(std::move(*withdrawn), *capability);
  set.set_supply(supply - burned);
  set.emit(event_kind_t::burn, caller, from, burned);
  return commit(std::move(set), kBurnCodespace, "burned");
}

operation_result_t ledger::transfer(const account_id_t& caller,
                                    const account_id_t& to,
                                    const amount_t amount) {
  if (!registry_.initialized()) {
    return reject(kTransferCodespace, ledger_error_code::not_initialized);
  }

  const auto& capabilities = registry_.capabilities();
  auto set = working_set{storage_, capabilities.extend()};
  auto& source = set.resolve(caller);
  auto error = ledger_error_code::ok;
  auto withdrawn =
      dispatcher_.withdraw(source, amount, capabilities.transfer(), error);
  if (!withdrawn) {
    return reject(kTransferCodespace, error, "withdraw gate");
  }

  auto& destination = set.resolve(to);
  error = dispatcher_.deposit(destination, std::move(*withdrawn),
                              capabilities.transfer());
  if (error != ledger_error_code::ok) {
    // Dropping the working set discards the debit above.
    return reject(kTransferCodespace, error, "deposit gate");
  }
  return commit(std::move(set), kTransferCodespace, "transferred");
}

amount_t ledger::balance_of(const account_id_t& account) const {
  return storage_.load_balance(account).value_or(0);
}

amount_t ledger::total_supply() const {
  return storage_.load_supply();
}

std::optional<asset_descriptor_t> ledger::asset_descriptor() const {
  if (!registry_.record()) {
    return std::nullopt;
  }
  return registry_.record()->descriptor;
}

audit_result ledger::audit() const {
  auto result = audit_result{};
  result.total_supply = storage_.load_supply();
  for (const auto& [owner, balance] : storage_.list_balances()) {
    result.balance_sum += balance;
    ++result.accounts;
  }
  result.ok = result.balance_sum == wide_amount_t{result.total_supply};
  if (!result.ok) {
    spdlog::error("Supply audit failed: supply {} != balance sum {}",
                  result.total_supply, result.balance_sum.str());
  }
  return result;
}

operation_result_t ledger::commit(working_set&& set,
                                  const std::string_view codespace,
                                  std::string info) {
  auto changeset = std::move(set).into_changeset();
  storage_.apply(changeset);

  auto result = operation_result_t{};
  result.codespace = std::string{codespace};
  result.info = std::move(info);
  result.events = std::move(changeset.events);
  spdlog::debug("{} committed: {} store(s), {} event(s)", codespace,
                changeset.balances.size(), result.events.size());
  return result;
}

}  // namespace sentinel::execution
