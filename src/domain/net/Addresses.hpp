#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uoe::arp::domain::net
{

// IPv4 address, octets[0] is the most significant byte (b0)
struct Ipv4Address
{
  std::array<uint8_t, 4> octets{};

  static constexpr Ipv4Address from_u32(uint32_t v) noexcept
  {
    return Ipv4Address{{static_cast<uint8_t>(v >> 24), static_cast<uint8_t>(v >> 16),
                        static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v)}};
  }

  constexpr uint32_t to_u32() const noexcept
  {
    return (static_cast<uint32_t>(octets[0]) << 24) | (static_cast<uint32_t>(octets[1]) << 16) |
           (static_cast<uint32_t>(octets[2]) << 8) | static_cast<uint32_t>(octets[3]);
  }

  constexpr bool operator==(const Ipv4Address&) const = default;
};

// 48-bit link address, octets[0] goes on the wire first
struct MacAddress
{
  std::array<uint8_t, 6> octets{};

  static constexpr MacAddress from_u64(uint64_t v) noexcept
  {
    MacAddress m{};
    for (std::size_t i = 0; i < 6; ++i)
    {
      m.octets[i] = static_cast<uint8_t>(v >> (8 * (5 - i)));
    }
    return m;
  }

  constexpr uint64_t to_u64() const noexcept
  {
    uint64_t v = 0;
    for (auto o : octets) v = (v << 8) | o;
    return v;
  }

  constexpr bool operator==(const MacAddress&) const = default;
};

// An address together with the link address it resolves to. Used for table
// slots, the cache entry and insert requests alike.
struct Mapping
{
  Ipv4Address address{};
  MacAddress link{};

  constexpr bool operator==(const Mapping&) const = default;
};

// ---- Reserved values ----
inline constexpr Ipv4Address kBroadcastIp = Ipv4Address::from_u32(0xFFFFFFFFu);
inline constexpr MacAddress kBroadcastMac = MacAddress::from_u64(0xFFFFFFFFFFFFull);
// Target hardware address carried by a request that is broadcast on the wire
inline constexpr MacAddress kBroadcastTargetMac = MacAddress::from_u64(0);

// 224.0.0.0/4 maps onto 01:00:5E:0x:xx:xx (RFC 1112)
inline constexpr uint8_t kMulticastTopNibble = 0xE;
inline constexpr std::array<uint8_t, 3> kMulticastMacPrefix{0x01, 0x00, 0x5E};

constexpr bool is_broadcast(const Ipv4Address& ip) noexcept
{
  return ip == kBroadcastIp;
}

constexpr bool is_broadcast(const MacAddress& mac) noexcept
{
  return mac == kBroadcastMac;
}

constexpr bool is_multicast(const Ipv4Address& ip) noexcept
{
  return (ip.octets[0] >> 4) == kMulticastTopNibble;
}

// Prefix ++ '0' ++ low 23 bits of the address
constexpr MacAddress multicast_mac(const Ipv4Address& ip) noexcept
{
  return MacAddress{{kMulticastMacPrefix[0], kMulticastMacPrefix[1], kMulticastMacPrefix[2],
                     static_cast<uint8_t>(ip.octets[1] & 0x7F), ip.octets[2], ip.octets[3]}};
}

// XOR-fold of the four octets; 256 possible slots
constexpr uint8_t hash_index(const Ipv4Address& ip) noexcept
{
  return static_cast<uint8_t>((ip.octets[0] ^ ip.octets[1]) ^ (ip.octets[2] ^ ip.octets[3]));
}

// ---- Text conversions ----
std::string to_string(const Ipv4Address& ip);
std::string to_string(const MacAddress& mac);

// "a.b.c.d"
std::optional<Ipv4Address> parse_ipv4(std::string_view text);
// "aa:bb:cc:dd:ee:ff" (':' or '-' separated)
std::optional<MacAddress> parse_mac(std::string_view text);

}  // namespace uoe::arp::domain::net
