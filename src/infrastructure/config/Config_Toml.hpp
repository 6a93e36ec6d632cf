#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace uoe::arp::infrastructure::config
{

class Config_Toml : public uoe::arp::application::ports::IConfigProvider
{
 public:
  uoe::arp::domain::Settings load_or_create(const std::string& path) override;

 private:
  static void write_default(const boost::filesystem::path& path, uoe::arp::domain::Settings& s);
};

}  // namespace uoe::arp::infrastructure::config
