#pragma once

#include <memory>

namespace sentinel::execution {

class asset_registry;
class capability_bundle;

struct extend_tag final {};
struct mint_tag final {};
struct burn_tag final {};
struct transfer_tag final {};

/// Unforgeable authority token.
///
/// Capabilities cannot be default constructed, copied or moved by anyone but
/// the capability bundle, which in turn is only constructed by the asset
/// registry. Code that wants to perform a privileged mutation has to be lent a
/// reference by the registry.
template <typename Tag>
class capability final {
 public:
  capability(const capability&) = delete;
  capability& operator=(const capability&) = delete;
  capability(capability&&) = delete;
  capability& operator=(capability&&) = delete;
  ~capability() = default;

 private:
  friend class capability_bundle;
  capability() = default;
};

using extend_capability = capability<extend_tag>;
using mint_capability = capability<mint_tag>;
using burn_capability = capability<burn_tag>;
using transfer_capability = capability<transfer_tag>;

/// The four authority tokens of one deployment.
class capability_bundle final {
 public:
  capability_bundle(const capability_bundle&) = delete;
  capability_bundle& operator=(const capability_bundle&) = delete;
  capability_bundle(capability_bundle&&) = delete;
  capability_bundle& operator=(capability_bundle&&) = delete;
  ~capability_bundle() = default;

  const extend_capability& extend() const { return extend_; }
  const mint_capability& mint() const { return mint_; }
  const burn_capability& burn() const { return burn_; }
  const transfer_capability& transfer() const { return transfer_; }

 private:
  friend class asset_registry;
  capability_bundle() = default;

  static std::unique_ptr<capability_bundle> make() {
    return std::unique_ptr<capability_bundle>{new capability_bundle{}};
  }

  extend_capability extend_;
  mint_capability mint_;
  burn_capability burn_;
  transfer_capability transfer_;
};

}  // namespace sentinel::execution
