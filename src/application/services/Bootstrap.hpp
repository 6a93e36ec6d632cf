#pragma once
#include <sstream>
#include <string>

#include "application/ports/IConfigProvider.hpp"
#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace uoe::arp::application::services {

struct Bootstrap {
  ports::IConfigProvider& cfg;
  ports::ILogger&         log;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  domain::Settings run(const std::string& configPath) {
    auto s = cfg.load_or_create(configPath);
    log.init(s);

    using ports::LogLevel;
    namespace net = domain::net;

    log.app(LogLevel::info, "uoe-arp resolver started");
    log.app(LogLevel::info, std::string("Config file: ") + s.configPath);
    log.app(LogLevel::info, "Local identity: " + net::to_string(s.identity.ip) + " / " +
                                net::to_string(s.identity.mac));

    std::ostringstream stream;
    stream << "Beat width: " << s.stream.beatBytes << " bytes"
           << " | timeoutMs: " << s.arp.timeoutMs
           << " | tryings: " << s.arp.tryings
           << " | gratuitousReq: " << b2s(s.arp.gratuitousReq);
    log.app(LogLevel::info, stream.str());

    std::ostringstream flags;
    flags << "Console: " << b2s(s.showConsole)
          << " | saveLog: " << b2s(s.saveLog)
          << " | saveWireLog: " << b2s(s.saveWireLog);
    log.app(LogLevel::info, flags.str());

    if (!s.arp.staticEntries.empty())
      log.app(LogLevel::info, "Static bindings: " + std::to_string(s.arp.staticEntries.size()));

    return s;
  }
};

} // namespace uoe::arp::application::services
