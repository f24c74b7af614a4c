#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "academy/common/device_state.hpp"

namespace academy::client {

class ClientStateView {
public:
  enum class Change { None, Updated, Added, Removed, Replaced };

  Change apply(const nlohmann::json &message);

  Change apply_snapshot(const common::StateSnapshot &snapshot);
  void replace_all(const std::vector<common::StateSnapshot> &snapshots);
  bool erase(const std::string &box_id);
  void clear();

  std::optional<common::StateSnapshot> get(const std::string &box_id) const;
  std::vector<common::StateSnapshot> devices() const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, common::StateSnapshot> devices_;
};

} // namespace academy::client
