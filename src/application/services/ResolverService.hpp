#pragma once

#include <cstdint>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/services/resolution/FrameEncoder.hpp"
#include "application/services/resolution/ResolutionCache.hpp"
#include "application/services/resolution/ResolutionTable.hpp"
#include "domain/Settings.hpp"
#include "shared/stream/Handshake.hpp"

namespace uoe::arp::application::services
{

// Cache, table and frame encoder advanced together, one tick per step().
// The cache's table query and the table's answer are wired internally; the
// remaining interfaces are exposed to the caller.
class ResolverService
{
 public:
  struct Inputs
  {
    shared::stream::Channel<domain::net::Ipv4Address> lookup;
    bool lookup_response_ready{false};
    shared::stream::Channel<domain::net::Mapping> insert;
    bool clear{false};
    shared::stream::Channel<FrameRequest> control;
    bool frame_ready{false};
  };

  ResolverService(const domain::Settings& s, ports::ILogger& logger);

  // Abandons everything in flight without answering it
  void reset();

  void step(const Inputs& in);

  // Writes static bindings straight into their slots through the diagnostic port
  void preload(const std::vector<domain::net::Mapping>& entries);

  void set_identity(const LocalIdentity& identity) noexcept;
  const LocalIdentity& identity() const noexcept { return cache_.identity(); }

  // ---- outputs, stable between steps ----
  bool lookup_ready() const noexcept { return cache_.request_ready(); }
  shared::stream::Channel<Resolution> lookup_response() const noexcept { return cache_.response(); }
  bool insert_ready() const noexcept { return table_.insert_ready(); }
  bool clearing() const noexcept { return table_.clearing(); }
  bool clear_done() const noexcept { return table_.clear_done(); }
  bool control_ready() const noexcept { return encoder_.control_ready(); }
  shared::stream::Channel<shared::stream::Beat> frame_out() const { return encoder_.out(); }

  ResolutionTable& table() noexcept { return table_; }
  const ResolutionTable& table() const noexcept { return table_; }
  const ResolutionCache& cache() const noexcept { return cache_; }
  const FrameEncoder& encoder() const noexcept { return encoder_; }

  uint64_t ticks() const noexcept { return ticks_; }
  uint64_t table_queries() const noexcept { return table_queries_; }

 private:
  ports::ILogger& log_;
  ResolutionTable table_;
  ResolutionCache cache_;
  FrameEncoder encoder_;
  shared::stream::BeatCollector collector_;
  uint64_t ticks_{0};
  uint64_t table_queries_{0};
};

}  // namespace uoe::arp::application::services
