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

namespace scanbridge::infrastructure::config
{

class Config_Toml : public scanbridge::application::ports::IConfigProvider
{
 public:
  scanbridge::domain::Settings load_or_create(const std::string& path) override;

 private:
  static void write_default(const boost::filesystem::path& path, scanbridge::domain::Settings& s);
};

}  // namespace scanbridge::infrastructure::config
