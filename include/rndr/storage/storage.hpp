#pragma once
#include <rndr/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace rndr::storage {

using key_value_entry_t =
    std::pair<rndr::schema::bytes_t, rndr::schema::bytes_t>;

/// One pending row mutation; std::nullopt deletes the key.
using write_entry_t =
    std::pair<rndr::schema::bytes_t, std::optional<rndr::schema::bytes_t>>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  rndr::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const rndr::schema::bytes_view_t& key) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<rndr::schema::bytes_t> get_raw(
      const rndr::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const rndr::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically apply row mutations together with the new checkpoint.
  void commit_block(const std::vector<write_entry_t>& writes,
                    const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const rndr::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace rndr::storage
