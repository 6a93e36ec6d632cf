#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/filesystem.hpp>
#include <chrono>
#include <vector>

namespace fs = boost::filesystem;
using uoe::arp::application::ports::LogLevel;

namespace uoe::arp::infrastructure::logging {

namespace {
constexpr std::size_t kRotateBytes = 5 * 1024 * 1024;
constexpr std::size_t kRotateFiles = 3;
constexpr std::size_t kQueueSize   = 8192;
constexpr std::size_t kWorkers     = 1;
}  // namespace

// -------------------------------------------------------------------------------------------------
// map_level
//  - ports::LogLevel to spdlog's level enum; shared by app(), wire() and set_level().
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

static void configure_console_colors_(const std::shared_ptr<spdlog::sinks::ansicolor_stdout_sink_mt>& sink) {
  sink->set_color(spdlog::level::trace,    "\x1b[90m");
  sink->set_color(spdlog::level::debug,    "\x1b[36m");
  sink->set_color(spdlog::level::info,     "\x1b[32m");
  sink->set_color(spdlog::level::warn,     "\x1b[33m");
  sink->set_color(spdlog::level::err,      "\x1b[31m");
  sink->set_color(spdlog::level::critical, "\x1b[35m");
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - "app" channel writes to appLogFilename when saveLog is set.
//  - "wire" channel writes to wireLogFilename when saveWireLog is set.
//  - A colored stdout sink is shared by both channels when showConsole is set.
//  - Loggers are async on the global spdlog pool; calling init() again replaces them.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const uoe::arp::domain::Settings& s) {
  const fs::path dir      = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};
  const fs::path appPath  = dir / (s.appLogFilename.empty()  ? "arp_app.log"  : s.appLogFilename);
  const fs::path wirePath = dir / (s.wireLogFilename.empty() ? "arp_wire.log" : s.wireLogFilename);

  if (s.saveLog || s.saveWireLog) {
    fs::create_directories(dir);
  }

  if (auto prev = spdlog::get("app"))  spdlog::drop(prev->name());
  if (auto prev = spdlog::get("wire")) spdlog::drop(prev->name());

  std::vector<spdlog::sink_ptr> app_sinks;
  std::vector<spdlog::sink_ptr> wire_sinks;

  if (s.saveLog) {
    auto f = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(appPath.string(), kRotateBytes, kRotateFiles);
    f->set_level(spdlog::level::trace);
    app_sinks.push_back(f);
  }
  if (s.saveWireLog) {
    auto f = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(wirePath.string(), kRotateBytes, kRotateFiles);
    f->set_level(spdlog::level::trace);
    wire_sinks.push_back(f);
  }
  if (s.showConsole) {
    auto console = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
    configure_console_colors_(console);
    console->set_level(spdlog::level::debug);
    app_sinks.push_back(console);
    wire_sinks.push_back(console);
  }

  if (!spdlog::thread_pool()) {
    spdlog::init_thread_pool(kQueueSize, kWorkers);
  }
  app_  = std::make_shared<spdlog::async_logger>("app",  app_sinks.begin(),  app_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  wire_ = std::make_shared<spdlog::async_logger>("wire", wire_sinks.begin(), wire_sinks.end(),
             spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::register_logger(app_);
  spdlog::register_logger(wire_);

  // Only the console renders colors between %^ and %$
  const char* pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";
  app_->set_pattern(pattern);
  wire_->set_pattern(pattern);

  app_->set_level(spdlog::level::trace);
  wire_->set_level(spdlog::level::trace);

  app_->flush_on(spdlog::level::err);
  wire_->flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(2));
}

void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

void Logger_Spdlog::wire(LogLevel level, std::string_view msg) {
  if (wire_) wire_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// set_level(level)
//  - Adjusts both channels at runtime; per-sink levels still apply.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::set_level(LogLevel level) {
  auto lv = map_level(level);
  if (app_)  app_->set_level(lv);
  if (wire_) wire_->set_level(lv);
}

void Logger_Spdlog::flush() {
  if (app_)  app_->flush();
  if (wire_) wire_->flush();
}

} // namespace uoe::arp::infrastructure::logging
