#include "academy/client/client_state_view.hpp"

#include "academy/common/wire_format.hpp"

namespace academy::client {

ClientStateView::Change ClientStateView::apply(const nlohmann::json &message) {
  if (!message.is_object()) {
    return Change::None;
  }
  const auto type = message.value("type", "");
  if (type == "state") {
    return apply_snapshot(common::snapshot_from_json(message.at("device")));
  }
  if (type == "full_sync") {
    std::vector<common::StateSnapshot> snapshots;
    for (const auto &node : message.at("devices")) {
      snapshots.push_back(common::snapshot_from_json(node));
    }
    replace_all(snapshots);
    return Change::Replaced;
  }
  if (type == "device_removed") {
    return erase(message.value("box_id", "")) ? Change::Removed : Change::None;
  }
  return Change::None;
}

ClientStateView::Change
ClientStateView::apply_snapshot(const common::StateSnapshot &snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(snapshot.box_id);
  if (it == devices_.end()) {
    devices_.emplace(snapshot.box_id, snapshot);
    return Change::Added;
  }
  // A state message queued before a resync can arrive after it.
  if (snapshot.version < it->second.version) {
    return Change::None;
  }
  it->second = snapshot;
  return Change::Updated;
}

void ClientStateView::replace_all(
    const std::vector<common::StateSnapshot> &snapshots) {
  std::map<std::string, common::StateSnapshot> next;
  for (const auto &snapshot : snapshots) {
    next[snapshot.box_id] = snapshot;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  devices_ = std::move(next);
}

bool ClientStateView::erase(const std::string &box_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.erase(box_id) != 0;
}

void ClientStateView::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_.clear();
}

std::optional<common::StateSnapshot>
ClientStateView::get(const std::string &box_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(box_id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<common::StateSnapshot> ClientStateView::devices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<common::StateSnapshot> out;
  out.reserve(devices_.size());
  for (const auto &[box_id, snapshot] : devices_) {
    out.push_back(snapshot);
  }
  return out;
}

std::size_t ClientStateView::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

} // namespace academy::client
