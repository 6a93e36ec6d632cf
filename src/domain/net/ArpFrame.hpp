#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "domain/net/Addresses.hpp"

namespace uoe::arp::domain::net
{

// ---- Wire constants ----
inline constexpr uint16_t kEtherTypeArp = 0x0806;
inline constexpr uint16_t kEtherTypeIpv4 = 0x0800;
inline constexpr uint16_t kArpHardwareEthernet = 0x0001;
inline constexpr uint8_t kArpHardwareLength = 6;
inline constexpr uint8_t kArpProtocolLength = 4;

inline constexpr std::size_t kHeaderBytes = 42;   // Ethernet + ARP payload
inline constexpr std::size_t kFrameBytes = 60;    // Ethernet minimum, without FCS
inline constexpr std::size_t kPaddingBytes = kFrameBytes - kHeaderBytes;

enum class Opcode : uint16_t
{
  Request = 0x0001,
  Reply = 0x0002
};

enum class Field : uint8_t
{
  EthDestination,
  EthSource,
  EtherType,
  HardwareType,
  ProtocolType,
  HardwareLength,
  ProtocolLength,
  Operation,
  SenderHardware,
  SenderProtocol,
  TargetHardware,
  TargetProtocol
};

struct FieldSpan
{
  Field field;
  std::size_t offset;
  std::size_t length;
};

// Declared in wire order; offsets are contiguous and end at kHeaderBytes
inline constexpr std::array<FieldSpan, 12> kFieldSpans{{
    {Field::EthDestination, 0, 6},
    {Field::EthSource, 6, 6},
    {Field::EtherType, 12, 2},
    {Field::HardwareType, 14, 2},
    {Field::ProtocolType, 16, 2},
    {Field::HardwareLength, 18, 1},
    {Field::ProtocolLength, 19, 1},
    {Field::Operation, 20, 2},
    {Field::SenderHardware, 22, 6},
    {Field::SenderProtocol, 28, 4},
    {Field::TargetHardware, 32, 6},
    {Field::TargetProtocol, 38, 4},
}};

// One entry per meaningful frame byte: which field it belongs to and which
// byte of that field it is.
struct LayoutEntry
{
  std::size_t offset;
  Field field;
  std::size_t field_byte;
};

constexpr std::array<LayoutEntry, kHeaderBytes> make_layout() noexcept
{
  std::array<LayoutEntry, kHeaderBytes> out{};
  for (const auto& span : kFieldSpans)
  {
    for (std::size_t i = 0; i < span.length; ++i)
    {
      out[span.offset + i] = LayoutEntry{span.offset + i, span.field, i};
    }
  }
  return out;
}

inline constexpr std::array<LayoutEntry, kHeaderBytes> kLayout = make_layout();

static_assert(kFieldSpans.back().offset + kFieldSpans.back().length == kHeaderBytes,
              "ARP field spans must cover the header exactly");

// Decoded view of an ARP frame
struct ArpPacket
{
  MacAddress eth_destination{};
  MacAddress eth_source{};
  Opcode opcode{Opcode::Request};
  MacAddress sender_link{};
  Ipv4Address sender_address{};
  MacAddress target_link{};
  Ipv4Address target_address{};
};

// Validates the fixed fields (ethertype, hardware/protocol type and lengths,
// opcode) and returns the decoded packet. Trailing padding is ignored.
std::optional<ArpPacket> parse_arp_frame(std::span<const uint8_t> frame);

}  // namespace uoe::arp::domain::net
