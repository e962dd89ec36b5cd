#include "flakeid/machine/machine_id_provider.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::machine;

namespace {

NetworkInterface iface(std::string name, bool loopback, bool has_ipv4,
                       std::optional<HardwareAddress> mac) {
  return NetworkInterface{std::move(name), loopback, has_ipv4, mac};
}

}  // namespace

TEST_CASE("hardware_address_to_integer: big-endian 48-bit value", "[machine]") {
  CHECK(hardware_address_to_integer({0x00, 0x00, 0x00, 0x00, 0x00, 0x00}) == 0);
  CHECK(hardware_address_to_integer({0x00, 0x00, 0x00, 0x00, 0x01, 0x02}) == 0x0102);
  CHECK(hardware_address_to_integer({0x02, 0x42, 0xac, 0x11, 0x00, 0x02}) == 0x0242ac110002ULL);
  CHECK(hardware_address_to_integer({0xff, 0xff, 0xff, 0xff, 0xff, 0xff}) == 0xffffffffffffULL);
}

TEST_CASE("format_hardware_address: lowercase colon-separated hex", "[machine]") {
  CHECK(format_hardware_address({0x02, 0x42, 0xac, 0x11, 0x00, 0x02}) == "02:42:ac:11:00:02");
  CHECK(format_hardware_address({0x0f, 0xff, 0x00, 0x01, 0xa0, 0x0a}) == "0f:ff:00:01:a0:0a");
}

TEST_CASE("select_hardware_address: skips loopback and interfaces without IPv4", "[machine]") {
  const std::vector<NetworkInterface> interfaces = {
      iface("lo", true, true, HardwareAddress{}),
      iface("wlan0", false, false, HardwareAddress{0xaa, 0, 0, 0, 0, 0x01}),
      iface("eth0", false, true, HardwareAddress{0x02, 0x42, 0xac, 0x11, 0x00, 0x02}),
      iface("eth1", false, true, HardwareAddress{0xbb, 0, 0, 0, 0, 0x02}),
  };

  const auto selected = select_hardware_address(interfaces);
  REQUIRE(selected.has_value());
  CHECK(format_hardware_address(*selected) == "02:42:ac:11:00:02");
}

TEST_CASE("select_hardware_address: no eligible interface yields nullopt", "[machine]") {
  CHECK_FALSE(select_hardware_address({}).has_value());
  CHECK_FALSE(select_hardware_address({iface("lo", true, true, HardwareAddress{})}).has_value());
}

TEST_CASE("select_hardware_address: eligible interface without link address is all zero",
          "[machine]") {
  const auto selected = select_hardware_address({iface("tun0", false, true, std::nullopt)});
  REQUIRE(selected.has_value());
  CHECK(hardware_address_to_integer(*selected) == 0);
}

TEST_CASE("FixedMachineIdProvider: returns its value unchanged", "[machine]") {
  FixedMachineIdProvider provider(0x0242ac110002ULL);
  CHECK(provider.machine_id() == 0x0242ac110002ULL);
}

TEST_CASE("NetworkInterfaceMachineIdProvider: fits in 48 bits on any host", "[machine]") {
  NetworkInterfaceMachineIdProvider provider;
  CHECK(provider.machine_id() <= 0xffffffffffffULL);
}

TEST_CASE("list_network_interfaces: names are unique", "[machine]") {
  const auto interfaces = list_network_interfaces();
  for (std::size_t i = 0; i < interfaces.size(); ++i) {
    for (std::size_t j = i + 1; j < interfaces.size(); ++j) {
      CHECK(interfaces[i].name != interfaces[j].name);
    }
  }
}
