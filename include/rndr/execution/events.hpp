#pragma once

#include <rndr/schema/transaction_event.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace rndr::execution {

using event_attribute_list_t =
    std::initializer_list<std::pair<std::string_view, std::string>>;

inline rndr::schema::transaction_event_t make_event(
    const std::string_view type,
    const event_attribute_list_t attributes) {
  auto event = rndr::schema::transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(rndr::schema::transaction_event_attribute_t{
        .key = std::string{key}, .value = value, .index = true});
  }
  return event;
}

}  // namespace rndr::execution
