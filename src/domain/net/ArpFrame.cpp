#include "domain/net/ArpFrame.hpp"

namespace uoe::arp::domain::net
{

namespace
{
uint16_t be16(std::span<const uint8_t> b, std::size_t at)
{
  return static_cast<uint16_t>((b[at] << 8) | b[at + 1]);
}

MacAddress mac_at(std::span<const uint8_t> b, std::size_t at)
{
  MacAddress m{};
  for (std::size_t i = 0; i < m.octets.size(); ++i) m.octets[i] = b[at + i];
  return m;
}

Ipv4Address ip_at(std::span<const uint8_t> b, std::size_t at)
{
  Ipv4Address ip{};
  for (std::size_t i = 0; i < ip.octets.size(); ++i) ip.octets[i] = b[at + i];
  return ip;
}
}  // namespace

std::optional<ArpPacket> parse_arp_frame(std::span<const uint8_t> frame)
{
  if (frame.size() < kHeaderBytes) return std::nullopt;

  if (be16(frame, 12) != kEtherTypeArp) return std::nullopt;
  if (be16(frame, 14) != kArpHardwareEthernet) return std::nullopt;
  if (be16(frame, 16) != kEtherTypeIpv4) return std::nullopt;
  if (frame[18] != kArpHardwareLength || frame[19] != kArpProtocolLength) return std::nullopt;

  const uint16_t op = be16(frame, 20);
  if (op != static_cast<uint16_t>(Opcode::Request) && op != static_cast<uint16_t>(Opcode::Reply))
    return std::nullopt;

  ArpPacket p;
  p.eth_destination = mac_at(frame, 0);
  p.eth_source = mac_at(frame, 6);
  p.opcode = static_cast<Opcode>(op);
  p.sender_link = mac_at(frame, 22);
  p.sender_address = ip_at(frame, 28);
  p.target_link = mac_at(frame, 32);
  p.target_address = ip_at(frame, 38);
  return p;
}

}  // namespace uoe::arp::domain::net
