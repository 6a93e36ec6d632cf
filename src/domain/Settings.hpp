#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "domain/net/Addresses.hpp"

namespace uoe::arp::domain
{

struct Settings
{
  // Ambient identity, read-only to the resolver core
  struct Identity
  {
    net::Ipv4Address ip{net::Ipv4Address::from_u32(0xC0A80101)};          // 192.168.1.1
    net::MacAddress mac{net::MacAddress::from_u64(0x000A35033EF1ull)};  // 00:0A:35:03:3E:F1
  } identity;

  struct Stream
  {
    std::size_t beatBytes{8};
  } stream;

  struct Arp
  {
    // Consumed by the request/retry orchestration, not by the core
    int timeoutMs{2};
    int tryings{3};
    bool gratuitousReq{false};

    // Preloaded through the table's diagnostic port at start-up
    std::vector<net::Mapping> staticEntries;
  } arp;

  // Console / Logs
  bool showConsole{false};
  bool saveLog{true};
  bool saveWireLog{true};
  std::string logsDir{"logs"};
  std::string appLogFilename{"arp_app.log"};
  std::string wireLogFilename{"arp_wire.log"};
  std::string configPath{"uoe-arp.toml"};
};

}  // namespace uoe::arp::domain
