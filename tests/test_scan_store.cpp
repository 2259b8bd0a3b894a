#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <regex>

#include "TestSupport.hpp"
#include "infrastructure/storage/ScanStore_Fs.hpp"

using scanbridge::infrastructure::storage::ScanStore_Fs;
using scanbridge::testing::TestLogger;
namespace fs = boost::filesystem;

static void touch(const fs::path& p, std::time_t mtime)
{
  std::ofstream(p.string()) << "x";
  fs::last_write_time(p, mtime);
}

TEST(ScanStore, FilenameCarriesTimestampAndPeer)
{
  const auto name = ScanStore_Fs::make_filename("10.0.0.5", std::chrono::system_clock::now());
  EXPECT_TRUE(std::regex_match(name, std::regex(R"(received_file_\d{8}_\d{6}_\d{6}_10_0_0_5\.raw)")))
      << name;
}

TEST(ScanStore, AllocateCreatesDirectoryAndDistinctPaths)
{
  TestLogger log;
  const auto dir = scanbridge::testing::fresh_dir("alloc") / "nested";
  ScanStore_Fs store(dir.string(), 10, log);

  const auto a = store.allocate("127.0.0.1");
  std::ofstream(a) << "a";
  const auto b = store.allocate("127.0.0.1");

  EXPECT_TRUE(fs::is_directory(dir));
  EXPECT_NE(a, b);
  EXPECT_EQ(fs::path(a).parent_path(), dir);
}

TEST(ScanStore, RetentionKeepsNewestByModificationTime)
{
  TestLogger log;
  const auto dir = scanbridge::testing::fresh_dir("retention");
  const std::time_t base = std::time(nullptr) - 1000;

  // names sort opposite to mtimes so only mtime can explain the result
  touch(dir / "e.raw", base + 0);
  touch(dir / "d.raw", base + 10);
  touch(dir / "c.raw", base + 20);
  touch(dir / "b.raw", base + 30);
  touch(dir / "a.raw", base + 40);

  ScanStore_Fs store(dir.string(), 3, log);
  EXPECT_EQ(store.enforce_retention(), 2u);

  EXPECT_TRUE(fs::exists(dir / "a.raw"));
  EXPECT_TRUE(fs::exists(dir / "b.raw"));
  EXPECT_TRUE(fs::exists(dir / "c.raw"));
  EXPECT_FALSE(fs::exists(dir / "d.raw"));
  EXPECT_FALSE(fs::exists(dir / "e.raw"));

  const auto left = store.list();
  ASSERT_EQ(left.size(), 3u);
  EXPECT_EQ(fs::path(left[0]).filename().string(), "a.raw");
  EXPECT_EQ(fs::path(left[2]).filename().string(), "c.raw");

  // already within the cap
  EXPECT_EQ(store.enforce_retention(), 0u);
}

TEST(ScanStore, ZeroRetentionKeepsEverything)
{
  TestLogger log;
  const auto dir = scanbridge::testing::fresh_dir("keepall");
  for (int i = 0; i < 4; ++i) touch(dir / ("f" + std::to_string(i) + ".raw"), std::time(nullptr) - i);

  ScanStore_Fs store(dir.string(), 0, log);
  EXPECT_EQ(store.enforce_retention(), 0u);
  EXPECT_EQ(store.list().size(), 4u);
}

TEST(ScanStore, MissingDirectoryListsNothing)
{
  TestLogger log;
  ScanStore_Fs store((scanbridge::testing::fresh_dir("empty") / "absent").string(), 2, log);
  EXPECT_TRUE(store.list().empty());
  EXPECT_EQ(store.enforce_retention(), 0u);
}
