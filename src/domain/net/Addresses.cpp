#include "domain/net/Addresses.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace uoe::arp::domain::net
{

std::string to_string(const Ipv4Address& ip)
{
  std::ostringstream oss;
  for (std::size_t i = 0; i < ip.octets.size(); ++i)
  {
    if (i) oss << '.';
    oss << static_cast<unsigned>(ip.octets[i]);
  }
  return oss.str();
}

std::string to_string(const MacAddress& mac)
{
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');
  for (std::size_t i = 0; i < mac.octets.size(); ++i)
  {
    if (i) oss << ':';
    oss << std::setw(2) << static_cast<unsigned>(mac.octets[i]);
  }
  return oss.str();
}

std::optional<Ipv4Address> parse_ipv4(std::string_view text)
{
  Ipv4Address ip{};
  const char* p = text.data();
  const char* end = text.data() + text.size();

  for (std::size_t i = 0; i < 4; ++i)
  {
    if (i)
    {
      if (p == end || *p != '.') return std::nullopt;
      ++p;
    }
    unsigned v = 0;
    auto [next, ec] = std::from_chars(p, end, v, 10);
    if (ec != std::errc{} || next == p || next - p > 3 || v > 255) return std::nullopt;
    ip.octets[i] = static_cast<uint8_t>(v);
    p = next;
  }

  if (p != end) return std::nullopt;
  return ip;
}

std::optional<MacAddress> parse_mac(std::string_view text)
{
  // exactly six two-digit groups, five separators
  if (text.size() != 17) return std::nullopt;

  MacAddress mac{};
  for (std::size_t i = 0; i < 6; ++i)
  {
    const std::size_t at = i * 3;
    if (i)
    {
      const char sep = text[at - 1];
      if (sep != ':' && sep != '-') return std::nullopt;
    }
    unsigned v = 0;
    auto [next, ec] = std::from_chars(text.data() + at, text.data() + at + 2, v, 16);
    if (ec != std::errc{} || next != text.data() + at + 2) return std::nullopt;
    mac.octets[i] = static_cast<uint8_t>(v);
  }
  return mac;
}

}  // namespace uoe::arp::domain::net
