#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flakeid::machine {

using HardwareAddress = std::array<std::uint8_t, 6>;

// Snapshot of one host network interface, as needed for machine id derivation.
struct NetworkInterface {
  std::string name;                           // NOLINT(readability-identifier-naming)
  bool loopback{false};                       // NOLINT(readability-identifier-naming)
  bool has_ipv4{false};                       // NOLINT(readability-identifier-naming)
  std::optional<HardwareAddress> hw_address;  // NOLINT(readability-identifier-naming)
};

// Abstract machine id source for dependency injection.
// Host introspection is environment-dependent; tests substitute a fixed provider.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IMachineIdProvider {
 public:
  virtual ~IMachineIdProvider() = default;

  // Return a raw (unmasked) machine id. Callers mask it to their machine id width.
  virtual std::uint64_t machine_id() = 0;

 protected:
  IMachineIdProvider() = default;
  IMachineIdProvider(const IMachineIdProvider&) = default;
  IMachineIdProvider& operator=(const IMachineIdProvider&) = default;
  IMachineIdProvider(IMachineIdProvider&&) = default;
  IMachineIdProvider& operator=(IMachineIdProvider&&) = default;
};

// Production provider: hardware address of the first non-loopback interface carrying an IPv4
// address, read as a 48-bit big-endian integer. Returns 0 when no such interface exists.
class NetworkInterfaceMachineIdProvider final : public IMachineIdProvider {
 public:
  NetworkInterfaceMachineIdProvider() = default;
  ~NetworkInterfaceMachineIdProvider() override = default;

  NetworkInterfaceMachineIdProvider(const NetworkInterfaceMachineIdProvider&) = default;
  NetworkInterfaceMachineIdProvider& operator=(const NetworkInterfaceMachineIdProvider&) = default;
  NetworkInterfaceMachineIdProvider(NetworkInterfaceMachineIdProvider&&) = default;
  NetworkInterfaceMachineIdProvider& operator=(NetworkInterfaceMachineIdProvider&&) = default;

  std::uint64_t machine_id() override;
};

// Fixed provider: returns a constant, for tests and explicit deployments.
class FixedMachineIdProvider final : public IMachineIdProvider {
 public:
  explicit FixedMachineIdProvider(std::uint64_t id) : id_(id) {}
  ~FixedMachineIdProvider() override = default;

  FixedMachineIdProvider(const FixedMachineIdProvider&) = default;
  FixedMachineIdProvider& operator=(const FixedMachineIdProvider&) = default;
  FixedMachineIdProvider(FixedMachineIdProvider&&) = default;
  FixedMachineIdProvider& operator=(FixedMachineIdProvider&&) = default;

  std::uint64_t machine_id() override { return id_; }

 private:
  std::uint64_t id_;
};

// Enumerate host interfaces in the order the OS reports them.
// Returns an empty list if enumeration fails.
[[nodiscard]] std::vector<NetworkInterface> list_network_interfaces();

// Pick the hardware address of the first interface that is not loopback and has an IPv4
// address. An eligible interface without a hardware address yields an all-zero address.
[[nodiscard]] std::optional<HardwareAddress> select_hardware_address(
    const std::vector<NetworkInterface>& interfaces);

[[nodiscard]] std::uint64_t hardware_address_to_integer(const HardwareAddress& address);

// Render as lowercase colon-separated hex, e.g. "02:42:ac:11:00:02".
[[nodiscard]] std::string format_hardware_address(const HardwareAddress& address);

}  // namespace flakeid::machine
