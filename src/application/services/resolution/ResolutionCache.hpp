#pragma once

#include <cstdint>
#include <optional>

#include "application/services/resolution/ResolutionTable.hpp"
#include "domain/net/Addresses.hpp"
#include "shared/stream/Handshake.hpp"

namespace uoe::arp::application::services
{

// Which rule produced a resolution
enum class ResolutionSource : uint8_t
{
  Broadcast,
  Local,
  Multicast,
  Cache,
  Table
};

const char* to_string(ResolutionSource s) noexcept;

struct Resolution
{
  domain::net::Ipv4Address address{};
  domain::net::MacAddress link{};
  bool found{false};
  ResolutionSource source{ResolutionSource::Table};
};

struct LocalIdentity
{
  domain::net::Ipv4Address ip{};
  domain::net::MacAddress mac{};
};

// Single-entry cache in front of ResolutionTable. One lookup is in flight at
// a time; special addresses are answered without touching the cache or the
// table, everything else goes through the cached entry or a table query.
class ResolutionCache
{
 public:
  using CacheEntry = domain::net::Mapping;

  enum class State : uint8_t
  {
    Idle,      // waiting for a lookup
    Query,     // presenting the query to the table
    Wait,      // query accepted, waiting for the answer
    Respond    // presenting the resolution to the client
  };

  struct Inputs
  {
    shared::stream::Channel<domain::net::Ipv4Address> request;
    bool response_ready{false};
    bool table_query_ready{false};
    shared::stream::Channel<TableAnswer> table_response;
  };

  explicit ResolutionCache(LocalIdentity identity = {}) : identity_(identity) {}

  void set_identity(const LocalIdentity& identity) noexcept { identity_ = identity; }
  const LocalIdentity& identity() const noexcept { return identity_; }

  // Empties the cache and abandons the lookup in flight without answering it
  void reset() noexcept;

  void step(const Inputs& in) noexcept;

  // ---- outputs, stable between steps ----
  bool request_ready() const noexcept { return state_ == State::Idle; }
  shared::stream::Channel<Resolution> response() const noexcept
  {
    return {state_ == State::Respond, response_};
  }
  shared::stream::Channel<domain::net::Ipv4Address> table_query() const noexcept
  {
    return {state_ == State::Query, address_};
  }
  bool table_response_ready() const noexcept { return state_ == State::Wait; }

  State state() const noexcept { return state_; }
  const std::optional<CacheEntry>& entry() const noexcept { return entry_; }

  // Rules that answer without the table, highest priority first
  std::optional<Resolution> resolve_locally(const domain::net::Ipv4Address& address) const noexcept;

 private:
  LocalIdentity identity_;
  State state_{State::Idle};
  domain::net::Ipv4Address address_{};
  Resolution response_{};
  std::optional<CacheEntry> entry_;
};

}  // namespace uoe::arp::application::services
