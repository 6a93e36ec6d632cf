#include "application/services/resolution/ResolutionCache.hpp"

namespace uoe::arp::application::services
{

namespace net = uoe::arp::domain::net;

const char* to_string(ResolutionSource s) noexcept
{
  switch (s)
  {
    case ResolutionSource::Broadcast: return "broadcast";
    case ResolutionSource::Local:     return "local";
    case ResolutionSource::Multicast: return "multicast";
    case ResolutionSource::Cache:     return "cache";
    case ResolutionSource::Table:     return "table";
  }
  return "unknown";
}

void ResolutionCache::reset() noexcept
{
  state_ = State::Idle;
  address_ = {};
  response_ = {};
  entry_.reset();
}

std::optional<Resolution> ResolutionCache::resolve_locally(const net::Ipv4Address& address) const noexcept
{
  if (net::is_broadcast(address))
    return Resolution{address, net::kBroadcastMac, true, ResolutionSource::Broadcast};

  if (address == identity_.ip)
    return Resolution{address, identity_.mac, true, ResolutionSource::Local};

  if (net::is_multicast(address))
    return Resolution{address, net::multicast_mac(address), true, ResolutionSource::Multicast};

  if (entry_ && entry_->address == address)
    return Resolution{address, entry_->link, true, ResolutionSource::Cache};

  return std::nullopt;
}

// -------------------------------------------------------------------------------------------------
// step(inputs)
//  - Idle:    accept a lookup; answer it locally or hand it to the table.
//  - Query:   hold the query until the table accepts it.
//  - Wait:    take the table answer; a hit replaces the cache entry.
//  - Respond: hold the resolution until the client accepts it.
// -------------------------------------------------------------------------------------------------
void ResolutionCache::step(const Inputs& in) noexcept
{
  switch (state_)
  {
    case State::Idle:
      if (in.request.valid)
      {
        if (auto r = resolve_locally(in.request.data))
        {
          response_ = *r;
          state_ = State::Respond;
        }
        else
        {
          address_ = in.request.data;
          state_ = State::Query;
        }
      }
      break;

    case State::Query:
      if (in.table_query_ready) state_ = State::Wait;
      break;

    case State::Wait:
      if (in.table_response.valid)
      {
        const TableAnswer& a = in.table_response.data;
        if (a.found) entry_ = CacheEntry{address_, a.link};
        response_ = Resolution{address_, a.found ? a.link : net::MacAddress{}, a.found,
                               ResolutionSource::Table};
        state_ = State::Respond;
      }
      break;

    case State::Respond:
      if (in.response_ready) state_ = State::Idle;
      break;
  }
}

}  // namespace uoe::arp::application::services
