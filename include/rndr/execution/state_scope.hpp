#pragma once

#include <rndr/schema/encoding/scale/encoder.hpp>
#include <rndr/schema/primitives.hpp>
#include <rndr/schema/transaction_event.hpp>
#include <rndr/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace rndr::execution {

using encoder_t = rndr::schema::encoding::encoder<
    rndr::schema::encoding::scale_encoder_tag>;
using storage_t = rndr::storage::storage<rndr::storage::rocksdb_storage_tag>;

/// Notification recorded by a contract while a scope is open.
struct emitted_event final {
  rndr::schema::address_t contract{};
  rndr::schema::transaction_event_t event;
};

/// Transactional overlay over committed storage.
///
/// A root scope reads through to storage; a child scope reads through to its
/// parent. Writes and notifications stay local until `commit()` folds them
/// into the parent. Dropping a child scope without committing discards
/// everything it recorded.
class state_scope final {
 public:
  state_scope(encoder_t& encoder, const storage_t& storage);
  explicit state_scope(state_scope& parent);

  state_scope(const state_scope&) = delete;
  state_scope& operator=(const state_scope&) = delete;
  state_scope(state_scope&&) = delete;
  state_scope& operator=(state_scope&&) = delete;
  ~state_scope() = default;

  std::optional<rndr::schema::bytes_t> get_raw(
      const rndr::schema::bytes_t& key) const;
  void put_raw(const rndr::schema::bytes_t& key, rndr::schema::bytes_t value);
  void erase(const rndr::schema::bytes_t& key);

  template <typename T>
  std::optional<T> get(const rndr::schema::bytes_t& key) const {
    auto raw = get_raw(key);
    if (!raw) {
      return std::nullopt;
    }
    return encoder_.template decode<T>(
        rndr::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(const rndr::schema::bytes_t& key, const T& value) {
    put_raw(key, encoder_.encode(value));
  }

  void emit(const rndr::schema::address_t& contract,
            rndr::schema::transaction_event_t event);
  const std::vector<emitted_event>& events() const;

  /// Fold writes and notifications into the parent scope.
  void commit();

  /// Drain the pending row mutations of a root scope for a storage batch.
  std::vector<rndr::storage::write_entry_t> take_writes();

  bool is_root() const;
  encoder_t& encoder() const;

 private:
  encoder_t& encoder_;
  const storage_t* storage_{nullptr};
  state_scope* parent_{nullptr};
  std::map<rndr::schema::bytes_t, std::optional<rndr::schema::bytes_t>> writes_;
  std::vector<emitted_event> events_;
};

}  // namespace rndr::execution
