#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace uoe::arp::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const uoe::arp::domain::Settings& s) = 0;
  // Lifecycle, configuration and resolver events
  virtual void app(LogLevel level, const std::string& msg) = 0;
  // Frames leaving the encoder
  virtual void wire(LogLevel level, std::string_view msg) = 0;
};

}  // namespace uoe::arp::application::ports
