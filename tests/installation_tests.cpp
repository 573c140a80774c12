#include "test_support.hpp"

#include "core/error.hpp"
#include "core/installation.hpp"

#include <functional>

static bool ThrowsKind(uuidfix::ErrorKind kind, const std::function<void()> &fn)
{
  try {
    fn();
  } catch (const uuidfix::FixError &e) {
    return e.kind() == kind;
  }
  return false;
}

static void TestMissingRootIsNotFound()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_inst_missing");
  EXPECT_TRUE(ThrowsKind(ErrorKind::NotFound, [&] { Installation mc(base / "nope"); }));

  WriteFile(base / "file.txt", "x");
  EXPECT_TRUE(ThrowsKind(ErrorKind::NotFound, [&] { Installation mc(base / "file.txt"); }));

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestSavesMustBeNamedSaves()
{
  using namespace uuidfix;

  EXPECT_TRUE(ThrowsKind(ErrorKind::InvalidLayout, [] { SaveCollection s("/tmp/worlds"); }));
  EXPECT_FALSE(ThrowsKind(ErrorKind::InvalidLayout, [] { SaveCollection s("/tmp/x/saves"); }));
}

static void TestVersionsAndSaves()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_inst_versions");
  fs::create_directories(base / "versions" / "1.20" / "saves" / "World B");
  fs::create_directories(base / "versions" / "1.20" / "saves" / "World A");
  WriteFile(base / "versions" / "1.20" / "saves" / "not-a-save.txt", "x");
  fs::create_directories(base / "versions" / "1.8.9");
  WriteFile(base / "versions" / "launcher_profiles.json", "{}");

  Installation mc(base);
  auto versions = mc.versions();
  ASSERT_TRUE(versions.size() == 2);
  EXPECT_EQ(versions[0].name, std::string("1.20"));
  EXPECT_EQ(versions[1].name, std::string("1.8.9"));

  auto saves = versions[0].saves().saves();
  ASSERT_TRUE(saves.size() == 2);
  EXPECT_EQ(saves[0].name, std::string("World A"));
  EXPECT_EQ(saves[1].name, std::string("World B"));

  // Lenient: a version without saves yields an empty collection
  SaveCollection empty = versions[1].saves();
  EXPECT_FALSE(empty.exists());
  EXPECT_TRUE(empty.saves().empty());

  // Shared saves are bound even when absent
  EXPECT_EQ(mc.non_isolated_saves().path(), base / "saves");
  EXPECT_FALSE(mc.non_isolated_saves().exists());

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestNoVersionsFolder()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_inst_noversions");
  Installation mc(base);
  EXPECT_TRUE(mc.versions().empty());
  EXPECT_TRUE(enumerate_collections(mc).empty());

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestEnumerateOffersIsolatedAndShared()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_inst_enum");
  fs::create_directories(base / "saves" / "Legacy");
  fs::create_directories(base / "versions" / "1.20" / "saves" / "MyWorld");
  fs::create_directories(base / "versions" / "1.19");

  Installation mc(base);
  auto choices = enumerate_collections(mc);
  ASSERT_TRUE(choices.size() == 2);

  EXPECT_TRUE(choices[0].kind == CollectionKind::Isolated);
  EXPECT_EQ(choices[0].version_name, std::string("1.20"));
  EXPECT_EQ(choices[0].label(), std::string("1.20"));
  EXPECT_EQ(choices[0].saves.path(), base / "versions" / "1.20" / "saves");

  EXPECT_TRUE(choices[1].kind == CollectionKind::NonIsolated);
  EXPECT_TRUE(choices[1].version_name.empty());
  EXPECT_EQ(choices[1].saves.path(), base / "saves");

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestFindCollection()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_inst_find");
  fs::create_directories(base / "versions" / "1.20" / "saves");

  Installation mc(base);
  CollectionChoice shared = find_collection(mc, "");
  EXPECT_TRUE(shared.kind == CollectionKind::NonIsolated);

  CollectionChoice isolated = find_collection(mc, "1.20");
  EXPECT_TRUE(isolated.kind == CollectionKind::Isolated);
  EXPECT_TRUE(isolated.saves.exists());

  EXPECT_TRUE(ThrowsKind(ErrorKind::NotFound, [&] { find_collection(mc, "2.0"); }));

  std::error_code ec;
  fs::remove_all(base, ec);
}

int main()
{
  TestMissingRootIsNotFound();
  TestSavesMustBeNamedSaves();
  TestVersionsAndSaves();
  TestNoVersionsFolder();
  TestEnumerateOffersIsolatedAndShared();
  TestFindCollection();

  return FinishTests("uuidfix_installation_tests");
}
