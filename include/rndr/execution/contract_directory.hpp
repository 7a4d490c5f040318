#pragma once

#include <rndr/execution/ports.hpp>
#include <rndr/schema/primitives.hpp>
#include <map>
#include <memory>
#include <type_traits>

namespace rndr::execution {

/// Resolves configured contract addresses to contracts and their ports.
class contract_directory final {
 public:
  contract_directory() = default;
  contract_directory(const contract_directory&) = delete;
  contract_directory& operator=(const contract_directory&) = delete;
  contract_directory(contract_directory&&) = default;
  contract_directory& operator=(contract_directory&&) = default;

  template <typename Contract>
  const Contract& add(std::unique_ptr<Contract> instance) {
    static_assert(std::is_base_of_v<contract, Contract>);
    const auto* raw = instance.get();
    const auto address = raw->address();
    if constexpr (std::is_base_of_v<token_port, Contract>) {
      tokens_[address] = raw;
    }
    if constexpr (std::is_base_of_v<escrow_port, Contract>) {
      escrows_[address] = raw;
    }
    contracts_[address] = std::move(instance);
    return *raw;
  }

  const contract* find(const rndr::schema::address_t& address) const {
    auto it = contracts_.find(address);
    return it == std::end(contracts_) ? nullptr : it->second.get();
  }

  const token_port* find_token(const rndr::schema::address_t& address) const {
    auto it = tokens_.find(address);
    return it == std::end(tokens_) ? nullptr : it->second;
  }

  const escrow_port* find_escrow(
      const rndr::schema::address_t& address) const {
    auto it = escrows_.find(address);
    return it == std::end(escrows_) ? nullptr : it->second;
  }

 private:
  std::map<rndr::schema::address_t, std::unique_ptr<contract>> contracts_;
  std::map<rndr::schema::address_t, const token_port*> tokens_;
  std::map<rndr::schema::address_t, const escrow_port*> escrows_;
};

}  // namespace rndr::execution
