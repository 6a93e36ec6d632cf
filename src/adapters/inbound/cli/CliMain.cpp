#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "application/services/Bootstrap.hpp"
#include "application/services/ResolverService.hpp"
#include "domain/net/ArpFrame.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "shared/hex/Hex.hpp"

namespace app = uoe::arp::application::services;
namespace net = uoe::arp::domain::net;
using uoe::arp::application::ports::LogLevel;

namespace
{
// Upper bound on ticks spent on one lookup or one frame
constexpr int kTickBudget = 256;

std::optional<app::Resolution> run_lookup(app::ResolverService& svc, const net::Ipv4Address& ip)
{
  bool sent = false;
  for (int t = 0; t < kTickBudget; ++t)
  {
    app::ResolverService::Inputs in;
    in.lookup = {!sent, ip};
    in.lookup_response_ready = true;

    const bool accepted = !sent && svc.lookup_ready();
    const auto rsp = svc.lookup_response();
    svc.step(in);

    if (accepted) sent = true;
    if (rsp.valid) return rsp.data;
  }
  return std::nullopt;
}

std::vector<uint8_t> run_frame(app::ResolverService& svc, const app::FrameRequest& req)
{
  uoe::arp::shared::stream::BeatCollector frame;
  bool sent = false;
  for (int t = 0; t < kTickBudget; ++t)
  {
    app::ResolverService::Inputs in;
    in.control = {!sent, req};
    in.frame_ready = true;

    const bool accepted = !sent && svc.control_ready();
    const auto beat = svc.frame_out();
    svc.step(in);

    if (accepted) sent = true;
    if (beat.valid && frame.push(beat.data)) return frame.take();
  }
  return {};
}

void print_frame(const char* tag, const std::vector<uint8_t>& bytes)
{
  std::cout << uoe::arp::shared::hex::make_line(tag, bytes) << "\n";
  if (auto p = net::parse_arp_frame(bytes))
  {
    std::cout << "  " << (p->opcode == net::Opcode::Request ? "request" : "reply")
              << " dst=" << net::to_string(p->eth_destination)
              << " tha=" << net::to_string(p->target_link)
              << " tpa=" << net::to_string(p->target_address) << "\n";
  }
}
}  // namespace

int main(int argc, char** argv)
{
  std::string configPath = (argc > 1) ? argv[1] : std::string{"uoe-arp.toml"};

  uoe::arp::infrastructure::config::Config_Toml cfg_impl;
  uoe::arp::infrastructure::logging::Logger_Spdlog log_impl;

  try
  {
    app::Bootstrap boot{cfg_impl, log_impl};
    const auto settings = boot.run(configPath);

    app::ResolverService svc{settings, log_impl};
    svc.preload(settings.arp.staticEntries);

    if (settings.arp.gratuitousReq)
    {
      print_frame("gratuitous", run_frame(svc, app::FrameRequest::gratuitous(svc.identity())));
    }

    for (int i = 2; i < argc; ++i)
    {
      auto ip = net::parse_ipv4(argv[i]);
      if (!ip)
      {
        std::cerr << "not an IPv4 address: " << argv[i] << "\n";
        continue;
      }

      auto r = run_lookup(svc, *ip);
      if (!r)
      {
        log_impl.app(LogLevel::err, std::string("lookup did not complete: ") + argv[i]);
        std::cerr << "lookup did not complete: " << argv[i] << "\n";
        continue;
      }

      if (r->found)
      {
        std::cout << net::to_string(r->address) << " is-at " << net::to_string(r->link) << " ("
                  << app::to_string(r->source) << ")\n";
      }
      else
      {
        std::cout << net::to_string(r->address) << " unresolved, who-has:\n";
        print_frame("request", run_frame(svc, app::FrameRequest::request(*ip)));
      }
    }

    log_impl.app(LogLevel::info, "Processed in " + std::to_string(svc.ticks()) + " ticks, " +
                                     std::to_string(svc.table_queries()) + " table queries");
    log_impl.flush();
  }
  catch (const std::exception& e)
  {
    std::cerr << "uoe-arp: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
