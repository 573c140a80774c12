#include "test_support.hpp"

#include "conf/config.hpp"

static void TestDefaults()
{
  using namespace uuidfix;

  Config config;
  EXPECT_TRUE(config.minecraft_dir.empty());
  EXPECT_TRUE(config.player_name.empty());
  ASSERT_TRUE(config.launcher_scripts.size() == 1);
  EXPECT_EQ(config.launcher_scripts[0], std::string("../PCL/LatestLaunch.bat"));
  EXPECT_EQ(config.usercache_name, std::string("usercache.json"));
  EXPECT_EQ(config.script_encoding, std::string("GB18030"));
  EXPECT_FALSE(config.include_root_usercache);
  EXPECT_FALSE(config.verbose);
}

static void TestFromFile()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_config_read");
  const fs::path file = base / "uuidfix.conf";
  WriteFile(file, "# comment\n"
                  "\n"
                  "minecraft_dir = \"/games/My Minecraft/.minecraft\"\n"
                  "player_name = Steve\n"
                  "launcher_scripts = ../PCL/LatestLaunch.bat, launch.sh ,,\n"
                  "include_root_usercache = true\n"
                  "script_encoding = 'GBK'\n"
                  "unknown_key = ignored\n"
                  "no equals sign here\n"
                  "verbose = true\r\n");

  Config config = Config::from_file(file);
  EXPECT_EQ(config.minecraft_dir, fs::path("/games/My Minecraft/.minecraft"));
  EXPECT_EQ(config.player_name, std::string("Steve"));
  ASSERT_TRUE(config.launcher_scripts.size() == 2);
  EXPECT_EQ(config.launcher_scripts[1], std::string("launch.sh"));
  EXPECT_TRUE(config.include_root_usercache);
  EXPECT_EQ(config.script_encoding, std::string("GBK"));
  EXPECT_EQ(config.usercache_name, std::string("usercache.json"));
  EXPECT_TRUE(config.verbose);

  bool threw = false;
  try {
    Config::from_file(base / "missing.conf");
  } catch (const std::runtime_error &) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestSaveThenLoad()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_config_write");
  const fs::path file = base / "uuidfix.conf";

  Config config;
  config.minecraft_dir = "/home/me/.minecraft";
  config.player_name = "Alex";
  config.launcher_scripts = {"a.bat", "b.sh"};
  config.usercache_name = "cache.json";
  config.log_file = base / "logs" / "uuidfix.log";
  ASSERT_TRUE(config.save_to_file(file));

  Config loaded = Config::from_file(file);
  EXPECT_EQ(loaded.minecraft_dir, config.minecraft_dir);
  EXPECT_EQ(loaded.player_name, config.player_name);
  EXPECT_TRUE(loaded.launcher_scripts == config.launcher_scripts);
  EXPECT_EQ(loaded.usercache_name, config.usercache_name);
  EXPECT_EQ(loaded.log_file, config.log_file);
  EXPECT_FALSE(loaded.include_root_usercache);

  EXPECT_FALSE(config.save_to_file(base / "no-such-dir" / "uuidfix.conf"));

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestMergeWithCli()
{
  using namespace uuidfix;

  Config config;
  config.minecraft_dir = "/from/file";
  config.player_name = "Steve";

  config.merge_with_cli("", "", false);
  EXPECT_EQ(config.minecraft_dir, fs::path("/from/file"));
  EXPECT_EQ(config.player_name, std::string("Steve"));
  EXPECT_FALSE(config.verbose);

  config.merge_with_cli("/from/cli", "Alex", true);
  EXPECT_EQ(config.minecraft_dir, fs::path("/from/cli"));
  EXPECT_EQ(config.player_name, std::string("Alex"));
  EXPECT_TRUE(config.verbose);
}

int main()
{
  TestDefaults();
  TestFromFile();
  TestSaveThenLoad();
  TestMergeWithCli();

  return FinishTests("uuidfix_config_tests");
}
