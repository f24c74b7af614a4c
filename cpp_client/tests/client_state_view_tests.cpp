#include <catch2/catch_test_macros.hpp>

#include "academy/client/client_state_view.hpp"
#include "academy/common/wire_format.hpp"

using academy::client::ClientStateView;
using academy::common::DeviceStatus;
using academy::common::StateSnapshot;
namespace wire = academy::common;

namespace {

StateSnapshot make_snapshot(const std::string &box_id, DeviceStatus state,
                            std::uint64_t version) {
  StateSnapshot snapshot;
  snapshot.box_id = box_id;
  snapshot.serial_locator = "EMU";
  snapshot.state = state;
  snapshot.version = version;
  snapshot.updated_at = std::chrono::system_clock::now();
  return snapshot;
}

} // namespace

TEST_CASE("State messages replace the stored device wholesale",
          "[client_state_view]") {
  ClientStateView view;

  auto first = make_snapshot("B1", DeviceStatus::Error, 3);
  first.last_error = "engine exited";
  CHECK(view.apply(wire::make_state_message(first)) ==
        ClientStateView::Change::Added);

  const auto second = make_snapshot("B1", DeviceStatus::Stopped, 4);
  CHECK(view.apply(wire::make_state_message(second)) ==
        ClientStateView::Change::Updated);

  const auto stored = view.get("B1");
  REQUIRE(stored);
  CHECK(stored->state == DeviceStatus::Stopped);
  CHECK(stored->version == 4);
  CHECK_FALSE(stored->last_error);
}

TEST_CASE("Older state messages do not overwrite newer state",
          "[client_state_view]") {
  ClientStateView view;
  view.apply(wire::make_full_sync_message(
      {make_snapshot("B1", DeviceStatus::RunningProtocol, 6)}));

  CHECK(view.apply(wire::make_state_message(
            make_snapshot("B1", DeviceStatus::Idle, 5))) ==
        ClientStateView::Change::None);
  CHECK(view.get("B1")->state == DeviceStatus::RunningProtocol);
  CHECK(view.get("B1")->version == 6);

  CHECK(view.apply(wire::make_state_message(
            make_snapshot("B1", DeviceStatus::Idle, 7))) ==
        ClientStateView::Change::Updated);
  CHECK(view.get("B1")->state == DeviceStatus::Idle);
}

TEST_CASE("A full sync drops devices the server no longer reports",
          "[client_state_view]") {
  ClientStateView view;
  view.apply_snapshot(make_snapshot("B1", DeviceStatus::Idle, 1));
  view.apply_snapshot(make_snapshot("B9", DeviceStatus::Idle, 1));

  const auto message = wire::make_full_sync_message(
      {make_snapshot("B1", DeviceStatus::RunningProtocol, 7),
       make_snapshot("B2", DeviceStatus::Stopped, 1)});
  CHECK(view.apply(message) == ClientStateView::Change::Replaced);

  CHECK(view.size() == 2);
  CHECK_FALSE(view.get("B9"));
  CHECK(view.get("B1")->state == DeviceStatus::RunningProtocol);
  CHECK(view.get("B2")->state == DeviceStatus::Stopped);
}

TEST_CASE("Removal messages erase known devices only", "[client_state_view]") {
  ClientStateView view;
  view.apply_snapshot(make_snapshot("B1", DeviceStatus::Stopped, 1));

  CHECK(view.apply(wire::make_removed_message("B2")) ==
        ClientStateView::Change::None);
  CHECK(view.apply(wire::make_removed_message("B1")) ==
        ClientStateView::Change::Removed);
  CHECK(view.size() == 0);
}

TEST_CASE("Messages without device state leave the view alone",
          "[client_state_view]") {
  ClientStateView view;
  view.apply_snapshot(make_snapshot("B1", DeviceStatus::Idle, 2));

  CHECK(view.apply(wire::make_server_closing_message()) ==
        ClientStateView::Change::None);
  CHECK(view.apply(wire::make_hello_message(4, academy::common::ClientRole::Remote)) ==
        ClientStateView::Change::None);
  CHECK(view.apply(nlohmann::json::array()) == ClientStateView::Change::None);
  CHECK(view.size() == 1);
}
