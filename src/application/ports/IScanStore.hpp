#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace scanbridge::application::ports
{

// Disk persistence of received scans with a bounded retention count.
struct IScanStore
{
  virtual ~IScanStore() = default;

  // Returns a fresh path (directory created) for a scan coming from peer_ip.
  virtual std::string allocate(const std::string& peer_ip) = 0;

  // Deletes everything beyond the newest `retention` files. Returns the number
  // of files removed; per-file failures are logged and skipped.
  virtual std::size_t enforce_retention() = 0;

  // Stored files, most recently modified first.
  virtual std::vector<std::string> list() const = 0;
};

}  // namespace scanbridge::application::ports
