#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <exception>
#include <fstream>
#include <toml++/toml.hpp>

#include "shared/stream/Handshake.hpp"

using uoe::arp::domain::Settings;
namespace fs = boost::filesystem;
namespace net = uoe::arp::domain::net;

namespace uoe::arp::infrastructure::config
{

namespace
{
constexpr const char* kDefaultLogsDir = "logs";
constexpr const char* kDefaultAppLog = "arp_app.log";
constexpr const char* kDefaultWireLog = "arp_wire.log";
constexpr std::size_t kDefaultBeatBytes = 8;

// Register field widths of the ARP configuration word
constexpr int64_t kMaxTimeoutMs = 4095;
constexpr int64_t kMaxTryings = 15;

const char* b2s(bool b) { return b ? "true" : "false"; }
}  // namespace

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());

  // Header
  out << "# uoe-arp.toml - Auto-generated initial configuration\n"
         "# Edit as needed and restart the application\n\n";

  // [identity]
  out << "[identity]\n";
  out << "localIp  = \"" << net::to_string(s.identity.ip) << "\"\n";
  out << "localMac = \"" << net::to_string(s.identity.mac) << "\"\n\n";

  // [stream]
  out << "[stream]\n";
  out << "beatBytes = " << kDefaultBeatBytes << "\n\n";

  // [arp]
  out << "[arp]\n";
  out << "timeoutMs     = " << s.arp.timeoutMs << "\n";
  out << "tryings       = " << s.arp.tryings << "\n";
  out << "gratuitousReq = " << b2s(s.arp.gratuitousReq) << "\n\n";
  out << "# Static bindings loaded into the table at start-up, e.g.\n";
  out << "# [[arp.static]]\n";
  out << "# ip  = \"192.168.1.10\"\n";
  out << "# mac = \"11:12:13:14:15:16\"\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole     = " << b2s(s.showConsole) << "\n";
  out << "saveLog         = " << b2s(s.saveLog) << "\n";
  out << "saveWireLog     = " << b2s(s.saveWireLog) << "\n";
  out << "logsDir         = \"" << kDefaultLogsDir << "\"\n";
  out << "appLogFilename  = \"" << kDefaultAppLog << "\"\n";
  out << "wireLogFilename = \"" << kDefaultWireLog << "\"\n";

  out.close();

  // mirror useful defaults back to Settings
  s.stream.beatBytes = kDefaultBeatBytes;
  s.logsDir = kDefaultLogsDir;
  s.appLogFilename = kDefaultAppLog;
  s.wireLogFilename = kDefaultWireLog;
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // unreadable file: rewrite it with defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [identity]
  // ---------------------------
  if (auto id = tbl["identity"].as_table())
  {
    if (auto v = (*id)["localIp"].value<std::string>())
    {
      if (auto ip = net::parse_ipv4(*v)) s.identity.ip = *ip;
    }
    if (auto v = (*id)["localMac"].value<std::string>())
    {
      if (auto mac = net::parse_mac(*v)) s.identity.mac = *mac;
    }
  }

  // ---------------------------
  // [stream]
  // ---------------------------
  if (auto st = tbl["stream"].as_table())
  {
    if (auto v = (*st)["beatBytes"].value<int64_t>())
    {
      if (*v >= 1 && *v <= static_cast<int64_t>(shared::stream::kMaxBeatBytes))
        s.stream.beatBytes = static_cast<std::size_t>(*v);
    }
  }

  // ---------------------------
  // [arp]
  // ---------------------------
  if (auto arp = tbl["arp"].as_table())
  {
    if (auto v = (*arp)["timeoutMs"].value<int64_t>(); v && *v >= 0 && *v <= kMaxTimeoutMs)
      s.arp.timeoutMs = static_cast<int>(*v);
    if (auto v = (*arp)["tryings"].value<int64_t>(); v && *v >= 0 && *v <= kMaxTryings)
      s.arp.tryings = static_cast<int>(*v);
    if (auto v = (*arp)["gratuitousReq"].value<bool>()) s.arp.gratuitousReq = *v;

    // [[arp.static]]: entries with a malformed ip or mac are skipped
    if (auto arr = (*arp)["static"].as_array())
    {
      for (auto& e : *arr)
      {
        auto t = e.as_table();
        if (!t) continue;
        auto ip = (*t)["ip"].value<std::string>();
        auto mac = (*t)["mac"].value<std::string>();
        if (!ip || !mac) continue;
        auto pip = net::parse_ipv4(*ip);
        auto pmac = net::parse_mac(*mac);
        if (pip && pmac) s.arp.staticEntries.push_back(net::Mapping{*pip, *pmac});
      }
    }
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) s.saveLog = *v;
    if (auto v = (*log)["saveWireLog"].value<bool>()) s.saveWireLog = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["wireLogFilename"].value<std::string>()) s.wireLogFilename = *v;
  }

  if (s.logsDir.empty()) s.logsDir = kDefaultLogsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = kDefaultAppLog;
  if (s.wireLogFilename.empty()) s.wireLogFilename = kDefaultWireLog;

  return s;
}

}  // namespace uoe::arp::infrastructure::config
