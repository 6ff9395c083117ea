#include <spdlog/spdlog.h>
#include <vigil/execution/staged_state.hpp>
#include <vector>

namespace vigil::execution {

staged_state::staged_state(storage_t& storage) : storage_{storage} {}

std::optional<vigil::schema::bytes_t> staged_state::get(
    const vigil::schema::bytes_view_t& key) const {
  auto staged = writes_.find(vigil::schema::make_bytes(key));
  if (staged != std::end(writes_)) {
    return staged->second;
  }
  return storage_.get_raw(key);
}

bool staged_state::contains(const vigil::schema::bytes_view_t& key) const {
  return get(key).has_value();
}

void staged_state::put(const vigil::schema::bytes_view_t& key,
                       vigil::schema::bytes_t value) {
  writes_[vigil::schema::make_bytes(key)] = std::move(value);
}

void staged_state::erase(const vigil::schema::bytes_view_t& key) {
  writes_[vigil::schema::make_bytes(key)] = std::nullopt;
}

size_t staged_state::pending_writes() const {
  return writes_.size();
}

void staged_state::commit() {
  if (writes_.empty()) {
    return;
  }
  auto entries = std::vector<vigil::storage::write_entry_t>{
      std::make_move_iterator(std::begin(writes_)),
      std::make_move_iterator(std::end(writes_))};
  writes_.clear();
  storage_.apply(entries);
}

void staged_state::discard() {
  if (!writes_.empty()) {
    spdlog::debug("Discarding {} staged writes", writes_.size());
  }
  writes_.clear();
}

}  // namespace vigil::execution
