#include "application/services/ResolverService.hpp"

#include <string>

#include "shared/hex/Hex.hpp"

using uoe::arp::application::ports::LogLevel;

namespace uoe::arp::application::services
{

namespace net = uoe::arp::domain::net;
using shared::stream::fires;

ResolverService::ResolverService(const domain::Settings& s, ports::ILogger& logger)
    : log_(logger),
      cache_(LocalIdentity{s.identity.ip, s.identity.mac}),
      encoder_(s.stream.beatBytes, LocalIdentity{s.identity.ip, s.identity.mac})
{
}

void ResolverService::set_identity(const LocalIdentity& identity) noexcept
{
  cache_.set_identity(identity);
  encoder_.set_identity(identity);
}

void ResolverService::reset()
{
  table_.reset();
  cache_.reset();
  encoder_.reset();
  collector_.take();
  log_.app(LogLevel::info, "Resolver reset at tick " + std::to_string(ticks_));
}

// -------------------------------------------------------------------------------------------------
// step(inputs)
//  - Every output is read before any component advances, so each component
//    sees the other side's signals as they were during this tick.
// -------------------------------------------------------------------------------------------------
void ResolverService::step(const Inputs& in)
{
  const auto query = cache_.table_query();
  const bool query_ready = table_.query_ready();
  const auto answer = table_.response();
  const bool answer_ready = cache_.table_response_ready();
  const auto resolution = cache_.response();
  const auto beat = encoder_.out();

  if (fires(query, query_ready)) ++table_queries_;

  if (fires(resolution, in.lookup_response_ready))
  {
    const Resolution& r = resolution.data;
    log_.app(LogLevel::debug, "resolve " + net::to_string(r.address) + " -> " +
                                  (r.found ? net::to_string(r.link) : std::string("not found")) +
                                  " (" + to_string(r.source) + ")");
  }

  if (fires(beat, in.frame_ready) && collector_.push(beat.data))
  {
    const auto frame = collector_.take();
    log_.wire(LogLevel::info, shared::hex::make_line("TX ARP", frame));
  }

  cache_.step({in.lookup, in.lookup_response_ready, query_ready, answer});
  table_.step({in.insert, query, answer_ready, in.clear});
  encoder_.step({in.control, in.frame_ready});

  if (table_.clear_done())
  {
    log_.app(LogLevel::info, "ARP table clear done at tick " + std::to_string(ticks_));
  }

  ++ticks_;
}

void ResolverService::preload(const std::vector<net::Mapping>& entries)
{
  for (const auto& e : entries)
  {
    const std::size_t slot = net::hash_index(e.address);
    const uint64_t link = e.link.to_u64();
    table_.diag_write(ResolutionTable::diag_address(slot, DiagField::Address), e.address.to_u32());
    table_.diag_write(ResolutionTable::diag_address(slot, DiagField::LinkLow),
                      static_cast<uint32_t>(link));
    table_.diag_write(ResolutionTable::diag_address(slot, DiagField::LinkHigh),
                      static_cast<uint32_t>(link >> 32));
    log_.app(LogLevel::debug, "static " + net::to_string(e.address) + " -> " +
                                  net::to_string(e.link) + " in slot " +
                                  shared::hex::to_hex(static_cast<uint8_t>(slot)));
  }
  if (!entries.empty())
  {
    log_.app(LogLevel::info, "Preloaded " + std::to_string(entries.size()) + " static binding(s)");
  }
}

}  // namespace uoe::arp::application::services
