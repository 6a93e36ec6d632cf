#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace uoe::arp::infrastructure::logging
{

class Logger_Spdlog final : public uoe::arp::application::ports::ILogger
{
 public:
  void init(const uoe::arp::domain::Settings& s) override;

  void app(uoe::arp::application::ports::LogLevel level, const std::string& msg) override;

  void wire(uoe::arp::application::ports::LogLevel level, std::string_view msg) override;

  void set_level(uoe::arp::application::ports::LogLevel level);

  // Requests a flush on both channels
  void flush();

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> wire_;

  // Helpers
  static spdlog::level::level_enum map_level(uoe::arp::application::ports::LogLevel l);
};

}  // namespace uoe::arp::infrastructure::logging
