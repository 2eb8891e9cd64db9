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

namespace hookline::proxy::infrastructure::config
{

class Config_Toml : public hookline::proxy::application::ports::IConfigProvider
{
 public:
  hookline::proxy::domain::Settings load_or_create(const std::string& path) override;

 private:
  static void write_default(const boost::filesystem::path& path, hookline::proxy::domain::Settings& s);
};

}  // namespace hookline::proxy::infrastructure::config
