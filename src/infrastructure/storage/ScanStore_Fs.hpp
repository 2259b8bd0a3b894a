#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IScanStore.hpp"

namespace scanbridge::infrastructure::storage
{

// Files are named received_file_<timestamp>_<peer ip, dots as underscores>.raw
class ScanStore_Fs final : public scanbridge::application::ports::IScanStore
{
 public:
  ScanStore_Fs(std::string dir, std::size_t retention, application::ports::ILogger& log)
      : dir_(std::move(dir)), retention_(retention), log_(log)
  {
  }

  std::string allocate(const std::string& peer_ip) override;
  std::size_t enforce_retention() override;
  std::vector<std::string> list() const override;

  static std::string make_filename(const std::string& peer_ip,
                                   std::chrono::system_clock::time_point when);

 private:
  std::string dir_;
  std::size_t retention_;
  application::ports::ILogger& log_;
  mutable std::mutex mtx_;
};

}  // namespace scanbridge::infrastructure::storage
