#include <rndr/common/critical.hpp>
#include <rndr/execution/state_scope.hpp>

#include <iterator>
#include <utility>

namespace rndr::execution {

state_scope::state_scope(encoder_t& encoder, const storage_t& storage)
    : encoder_{encoder}, storage_{&storage} {}

state_scope::state_scope(state_scope& parent)
    : encoder_{parent.encoder_}, parent_{&parent} {}

std::optional<rndr::schema::bytes_t> state_scope::get_raw(
    const rndr::schema::bytes_t& key) const {
  if (auto it = writes_.find(key); it != std::end(writes_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    return parent_->get_raw(key);
  }
  return storage_->get_raw(rndr::schema::bytes_view_t{key.data(), key.size()});
}

void state_scope::put_raw(const rndr::schema::bytes_t& key,
                          rndr::schema::bytes_t value) {
  writes_[key] = std::move(value);
}

void state_scope::erase(const rndr::schema::bytes_t& key) {
  writes_[key] = std::nullopt;
}

void state_scope::emit(const rndr::schema::address_t& contract,
                       rndr::schema::transaction_event_t event) {
  events_.push_back(
      emitted_event{.contract = contract, .event = std::move(event)});
}

const std::vector<emitted_event>& state_scope::events() const {
  return events_;
}

void state_scope::commit() {
  if (parent_ == nullptr) {
    rndr::common::critical("root state scope has no parent to commit into");
  }
  for (auto& [key, value] : writes_) {
    parent_->writes_[key] = std::move(value);
  }
  parent_->events_.insert(std::end(parent_->events_),
                          std::make_move_iterator(std::begin(events_)),
                          std::make_move_iterator(std::end(events_)));
  writes_.clear();
  events_.clear();
}

std::vector<rndr::storage::write_entry_t> state_scope::take_writes() {
  if (parent_ != nullptr) {
    rndr::common::critical("only a root state scope can be flushed");
  }
  auto out = std::vector<rndr::storage::write_entry_t>{};
  out.reserve(writes_.size());
  for (auto& [key, value] : writes_) {
    out.emplace_back(key, std::move(value));
  }
  writes_.clear();
  events_.clear();
  return out;
}

bool state_scope::is_root() const {
  return parent_ == nullptr;
}

encoder_t& state_scope::encoder() const {
  return encoder_;
}

}  // namespace rndr::execution
