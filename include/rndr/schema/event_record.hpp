#pragma once

#include <rndr/schema/primitives.hpp>
#include <rndr/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Persisted notification: append-only, ordered by event_id.
namespace rndr::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  address_t contract{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace rndr::schema
