#include "infrastructure/storage/ScanStore_Fs.hpp"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <cstdio>
#include <ctime>
#include <utility>

namespace fs = boost::filesystem;
using scanbridge::application::ports::LogLevel;

namespace scanbridge::infrastructure::storage
{

namespace
{
struct Entry
{
  fs::path path;
  std::time_t mtime;
};

// newest first; equal mtimes fall back to the name, whose timestamp sorts
bool newer(const Entry& a, const Entry& b)
{
  if (a.mtime != b.mtime) return a.mtime > b.mtime;
  return a.path.filename().string() > b.path.filename().string();
}

std::vector<Entry> collect(const fs::path& dir)
{
  std::vector<Entry> out;
  boost::system::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
  {
    boost::system::error_code fec;
    if (!fs::is_regular_file(it->path(), fec)) continue;
    const auto t = fs::last_write_time(it->path(), fec);
    if (fec) continue;
    out.push_back({it->path(), t});
  }
  std::sort(out.begin(), out.end(), newer);
  return out;
}
}  // namespace

std::string ScanStore_Fs::make_filename(const std::string& peer_ip,
                                        std::chrono::system_clock::time_point when)
{
  const std::time_t secs = std::chrono::system_clock::to_time_t(when);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(when.time_since_epoch()).count() %
      1000000;

  std::tm tm{};
  localtime_r(&secs, &tm);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
  char frac[8];
  std::snprintf(frac, sizeof(frac), "%06lld", static_cast<long long>(micros));

  std::string ip = peer_ip;
  std::replace(ip.begin(), ip.end(), '.', '_');
  std::replace(ip.begin(), ip.end(), ':', '_');

  return std::string("received_file_") + stamp + "_" + frac + "_" + ip + ".raw";
}

std::string ScanStore_Fs::allocate(const std::string& peer_ip)
{
  std::lock_guard<std::mutex> lk(mtx_);

  const fs::path dir{dir_};
  fs::create_directories(dir);

  fs::path p = dir / make_filename(peer_ip, std::chrono::system_clock::now());
  // two peers in the same microsecond: suffix instead of overwriting
  for (int n = 1; fs::exists(p); ++n)
  {
    p = dir / (p.stem().string() + "-" + std::to_string(n) + ".raw");
  }
  return p.string();
}

std::size_t ScanStore_Fs::enforce_retention()
{
  if (retention_ == 0) return 0;

  std::lock_guard<std::mutex> lk(mtx_);
  const auto entries = collect(fs::path{dir_});
  if (entries.size() <= retention_) return 0;

  std::size_t removed = 0;
  for (std::size_t i = retention_; i < entries.size(); ++i)
  {
    boost::system::error_code ec;
    if (fs::remove(entries[i].path, ec) && !ec)
    {
      ++removed;
      log_.app(LogLevel::debug, "[store] retired " + entries[i].path.filename().string());
    }
    else
    {
      log_.app(LogLevel::warn, "[store] could not delete " + entries[i].path.string() + ": " +
                                   (ec ? ec.message() : std::string("already gone")));
    }
  }

  log_.app(LogLevel::info, "[store] retention: kept " + std::to_string(retention_) +
                               ", removed " + std::to_string(removed));
  return removed;
}

std::vector<std::string> ScanStore_Fs::list() const
{
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<std::string> out;
  for (const auto& e : collect(fs::path{dir_})) out.push_back(e.path.string());
  return out;
}

}  // namespace scanbridge::infrastructure::storage
