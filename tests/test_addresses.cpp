#include <gtest/gtest.h>

#include "domain/net/Addresses.hpp"

namespace net = uoe::arp::domain::net;

TEST(Addresses, Ipv4RoundTripsThroughU32MostSignificantFirst)
{
  auto ip = net::Ipv4Address::from_u32(0xC0A8010A);
  EXPECT_EQ(ip.octets[0], 0xC0);
  EXPECT_EQ(ip.octets[3], 0x0A);
  EXPECT_EQ(ip.to_u32(), 0xC0A8010Au);
}

TEST(Addresses, MacRoundTripsThroughU64)
{
  auto mac = net::MacAddress::from_u64(0x0123456789ABull);
  EXPECT_EQ(mac.octets[0], 0x01);
  EXPECT_EQ(mac.octets[5], 0xAB);
  EXPECT_EQ(mac.to_u64(), 0x0123456789ABull);
}

TEST(Addresses, HashIsXorFoldOfOctets)
{
  EXPECT_EQ(net::hash_index(net::Ipv4Address::from_u32(0xC0A8010A)), 0x63);  // C0^A8^01^0A
  EXPECT_EQ(net::hash_index(net::Ipv4Address::from_u32(0x00000000)), 0x00);
  EXPECT_EQ(net::hash_index(net::Ipv4Address::from_u32(0xFFFFFFFF)), 0x00);
  // 10.0.0.5 and 10.0.5.0 share a slot
  EXPECT_EQ(net::hash_index(net::Ipv4Address::from_u32(0x0A000005)),
            net::hash_index(net::Ipv4Address::from_u32(0x0A000500)));
}

TEST(Addresses, MulticastRangeIsTopNibble1110)
{
  EXPECT_TRUE(net::is_multicast(net::Ipv4Address::from_u32(0xE0000001)));
  EXPECT_TRUE(net::is_multicast(net::Ipv4Address::from_u32(0xEFFFFFFF)));
  EXPECT_FALSE(net::is_multicast(net::Ipv4Address::from_u32(0xDFFFFFFF)));
  EXPECT_FALSE(net::is_multicast(net::Ipv4Address::from_u32(0xF0000000)));
}

TEST(Addresses, MulticastMacKeepsLow23Bits)
{
  EXPECT_EQ(net::multicast_mac(net::Ipv4Address::from_u32(0xE0010203)),
            net::MacAddress::from_u64(0x01005E010203ull));
  // bit 23 of the address is dropped
  EXPECT_EQ(net::multicast_mac(net::Ipv4Address::from_u32(0xEFFFFFFA)),
            net::MacAddress::from_u64(0x01005E7FFFFAull));
}

TEST(Addresses, ParsesAndFormatsDottedQuad)
{
  auto ip = net::parse_ipv4("192.168.1.105");
  ASSERT_TRUE(ip.has_value());
  EXPECT_EQ(ip->to_u32(), 0xC0A80169u);
  EXPECT_EQ(net::to_string(*ip), "192.168.1.105");

  EXPECT_FALSE(net::parse_ipv4("192.168.1").has_value());
  EXPECT_FALSE(net::parse_ipv4("192.168.1.256").has_value());
  EXPECT_FALSE(net::parse_ipv4("192.168.1.1.").has_value());
  EXPECT_FALSE(net::parse_ipv4("a.b.c.d").has_value());
  EXPECT_FALSE(net::parse_ipv4("").has_value());
}

TEST(Addresses, ParsesAndFormatsMac)
{
  auto mac = net::parse_mac("00:0a:35:03:3E:F1");
  ASSERT_TRUE(mac.has_value());
  EXPECT_EQ(mac->to_u64(), 0x000A35033EF1ull);
  EXPECT_EQ(net::to_string(*mac), "00:0A:35:03:3E:F1");

  EXPECT_TRUE(net::parse_mac("00-0A-35-03-3E-F1").has_value());
  EXPECT_FALSE(net::parse_mac("00:0A:35:03:3E").has_value());
  EXPECT_FALSE(net::parse_mac("00:0A:35:03:3E:GG").has_value());
  EXPECT_FALSE(net::parse_mac("000A:35:03:3E:F1:").has_value());
}
