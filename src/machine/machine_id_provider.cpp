#include "flakeid/machine/machine_id_provider.h"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netpacket/packet.h>
#include <sys/socket.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace flakeid::machine {

namespace {

struct IfAddrsDeleter {
  void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

NetworkInterface& find_or_add(std::vector<NetworkInterface>& interfaces, const char* name) {
  for (auto& iface : interfaces) {
    if (iface.name == name) {
      return iface;
    }
  }
  interfaces.push_back(NetworkInterface{name, false, false, std::nullopt});
  return interfaces.back();
}

}  // namespace

std::vector<NetworkInterface> list_network_interfaces() {
  ifaddrs* raw = nullptr;
  if (getifaddrs(&raw) != 0) {
    return {};
  }
  const std::unique_ptr<ifaddrs, IfAddrsDeleter> list(raw);

  // getifaddrs reports one entry per (interface, address family); fold them by name.
  std::vector<NetworkInterface> interfaces;
  for (const ifaddrs* entry = list.get(); entry != nullptr; entry = entry->ifa_next) {
    if (entry->ifa_name == nullptr) {
      continue;
    }
    auto& iface = find_or_add(interfaces, entry->ifa_name);
    iface.loopback = iface.loopback || (entry->ifa_flags & IFF_LOOPBACK) != 0;

    if (entry->ifa_addr == nullptr) {
      continue;
    }
    if (entry->ifa_addr->sa_family == AF_INET) {
      iface.has_ipv4 = true;
    } else if (entry->ifa_addr->sa_family == AF_PACKET) {
      const auto* link = reinterpret_cast<const sockaddr_ll*>(entry->ifa_addr);
      if (link->sll_halen == 6) {
        HardwareAddress mac{};
        for (std::size_t i = 0; i < mac.size(); ++i) {
          mac[i] = link->sll_addr[i];
        }
        iface.hw_address = mac;
      }
    }
  }
  return interfaces;
}

std::optional<HardwareAddress> select_hardware_address(
    const std::vector<NetworkInterface>& interfaces) {
  for (const auto& iface : interfaces) {
    if (iface.loopback || !iface.has_ipv4) {
      continue;
    }
    return iface.hw_address.value_or(HardwareAddress{});
  }
  return std::nullopt;
}

std::uint64_t hardware_address_to_integer(const HardwareAddress& address) {
  std::uint64_t value = 0;
  for (const auto octet : address) {
    value = (value << 8) | octet;
  }
  return value;
}

std::string format_hardware_address(const HardwareAddress& address) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < address.size(); ++i) {
    if (i > 0) {
      oss << ':';
    }
    oss << std::setw(2) << static_cast<unsigned>(address[i]);
  }
  return oss.str();
}

std::uint64_t NetworkInterfaceMachineIdProvider::machine_id() {
  const auto address = select_hardware_address(list_network_interfaces());
  if (!address.has_value()) {
    return 0;
  }
  return hardware_address_to_integer(address.value());
}

}  // namespace flakeid::machine
