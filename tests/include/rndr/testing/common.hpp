#pragma once

#include <rndr/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace rndr::testing {

inline rndr::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = rndr::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Address whose first byte is `seed` and every other byte is zero.
inline rndr::schema::address_t make_account(const uint8_t seed) {
  auto address = rndr::schema::address_t{};
  address[0] = seed;
  return address;
}

inline rndr::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return rndr::schema::signer_id_t{make_account(seed)};
}

inline rndr::schema::signer_id_t make_named_signer(
    const rndr::schema::address_t& account) {
  return rndr::schema::signer_id_t{account};
}

inline rndr::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = rndr::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline rndr::schema::amount_t make_amount(const uint64_t value) {
  return rndr::schema::amount_t{value};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace rndr::testing
