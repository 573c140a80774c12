#include "test_support.hpp"

#include "core/error.hpp"
#include "core/repair.hpp"

using namespace std::chrono_literals;

static const std::string kUuid = "069a79f4-44e9-4726-a5be-fca90e38aaf5";

static const uuidfix::CategoryResult *Find(const uuidfix::RepairReport &report,
                                           const std::string &category)
{
  for (const auto &result : report.categories) {
    if (result.category == category) {
      return &result;
    }
  }
  return nullptr;
}

static void TestRenamesLatestFilePerCategory()
{
  using namespace uuidfix;

  const fs::path save = MakeTempDir("uuidfix_repair_basic") / "World";
  WriteAged(save / "advancements" / "aaaaaaaa-0000-0000-0000-000000000000.json", 500s);
  WriteAged(save / "advancements" / "bbbbbbbb-0000-0000-0000-000000000000.json", 5s);
  WriteAged(save / "stats" / "bbbbbbbb-0000-0000-0000-000000000000.json", 5s);
  WriteAged(save / "playerdata" / "bbbbbbbb-0000-0000-0000-000000000000.dat", 5s, "nbt");

  RepairReport report = fix_save({"World", save}, kUuid);
  EXPECT_EQ(report.categories.size(), static_cast<size_t>(3));
  EXPECT_EQ(report.categories[0].category, std::string("advancements"));
  EXPECT_EQ(report.categories[1].category, std::string("stats"));
  EXPECT_EQ(report.categories[2].category, std::string("playerdata"));
  EXPECT_EQ(report.renamed(), static_cast<size_t>(3));
  EXPECT_EQ(report.skipped(), static_cast<size_t>(0));
  EXPECT_EQ(report.failed(), static_cast<size_t>(0));

  EXPECT_TRUE(fs::exists(save / "advancements" / (kUuid + ".json")));
  EXPECT_TRUE(fs::exists(save / "advancements" / "aaaaaaaa-0000-0000-0000-000000000000.json"));
  EXPECT_FALSE(fs::exists(save / "advancements" / "bbbbbbbb-0000-0000-0000-000000000000.json"));
  EXPECT_TRUE(fs::exists(save / "stats" / (kUuid + ".json")));
  EXPECT_TRUE(fs::exists(save / "playerdata" / (kUuid + ".dat")));

  const CategoryResult *adv = Find(report, "advancements");
  ASSERT_TRUE(adv != nullptr);
  EXPECT_EQ(adv->from.filename().string(), std::string("bbbbbbbb-0000-0000-0000-000000000000.json"));
  EXPECT_EQ(adv->to.filename().string(), kUuid + ".json");

  std::error_code ec;
  fs::remove_all(save.parent_path(), ec);
}

static void TestSecondRunIsIdempotent()
{
  using namespace uuidfix;

  const fs::path save = MakeTempDir("uuidfix_repair_idem") / "World";
  WriteAged(save / "advancements" / "old.json", 50s);
  WriteAged(save / "playerdata" / "old.dat", 50s, "nbt");

  RepairReport first = fix_save({"World", save}, kUuid);
  EXPECT_EQ(first.renamed(), static_cast<size_t>(2));

  RepairReport second = fix_save({"World", save}, kUuid);
  EXPECT_EQ(second.renamed(), static_cast<size_t>(0));
  EXPECT_EQ(second.failed(), static_cast<size_t>(0));
  EXPECT_EQ(second.skipped(), static_cast<size_t>(2));
  EXPECT_TRUE(Find(second, "advancements")->outcome == RepairOutcome::AlreadyNamed);
  EXPECT_TRUE(Find(second, "playerdata")->outcome == RepairOutcome::AlreadyNamed);
  EXPECT_TRUE(Find(second, "stats")->outcome == RepairOutcome::Missing);

  std::error_code ec;
  fs::remove_all(save.parent_path(), ec);
}

static void TestWrongExtensionIsSkippedWithWarning()
{
  using namespace uuidfix;

  const fs::path save = MakeTempDir("uuidfix_repair_ext") / "World";
  WriteAged(save / "stats" / "personal-notes.txt", 5s, "remember the diamonds");
  WriteAged(save / "playerdata" / "old.dat", 60s, "nbt");
  WriteAged(save / "playerdata" / "old.dat_old", 5s, "nbt");

  RepairReport report = fix_save({"World", save}, kUuid);
  const CategoryResult *stats = Find(report, "stats");
  ASSERT_TRUE(stats != nullptr);
  EXPECT_TRUE(stats->outcome == RepairOutcome::UnexpectedFileKind);
  EXPECT_FALSE(stats->message.empty());
  EXPECT_TRUE(fs::exists(save / "stats" / "personal-notes.txt"));
  EXPECT_FALSE(fs::exists(save / "stats" / (kUuid + ".json")));

  EXPECT_TRUE(Find(report, "playerdata")->outcome == RepairOutcome::UnexpectedFileKind);
  EXPECT_TRUE(fs::exists(save / "playerdata" / "old.dat"));

  EXPECT_EQ(report.warnings(), static_cast<size_t>(2));
  EXPECT_EQ(report.renamed(), static_cast<size_t>(0));
  EXPECT_EQ(report.failed(), static_cast<size_t>(0));

  std::error_code ec;
  fs::remove_all(save.parent_path(), ec);
}

static void TestExistingTargetIsNotOverwritten()
{
  using namespace uuidfix;

  const fs::path save = MakeTempDir("uuidfix_repair_collide") / "World";
  WriteAged(save / "stats" / (kUuid + ".json"), 300s, "{\"keep\":1}");
  WriteAged(save / "stats" / "stale.json", 5s, "{\"new\":1}");
  WriteAged(save / "advancements" / "stale.json", 5s);

  RepairReport report = fix_save({"World", save}, kUuid);
  const CategoryResult *stats = Find(report, "stats");
  ASSERT_TRUE(stats != nullptr);
  EXPECT_TRUE(stats->outcome == RepairOutcome::RenameFailed);
  EXPECT_TRUE(fs::exists(save / "stats" / "stale.json"));

  std::ifstream kept(save / "stats" / (kUuid + ".json"));
  std::string content((std::istreambuf_iterator<char>(kept)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, std::string("{\"keep\":1}"));

  // A failed category does not stop the others
  EXPECT_TRUE(Find(report, "advancements")->outcome == RepairOutcome::Renamed);
  EXPECT_EQ(report.failed(), static_cast<size_t>(1));
  EXPECT_EQ(report.renamed(), static_cast<size_t>(1));

  std::error_code ec;
  fs::remove_all(save.parent_path(), ec);
}

static void TestMissingSaveAndEmptyCategories()
{
  using namespace uuidfix;

  const fs::path base = MakeTempDir("uuidfix_repair_missing");

  bool threw = false;
  try {
    fix_save({"Gone", base / "Gone"}, kUuid);
  } catch (const FixError &e) {
    threw = e.kind() == ErrorKind::NotFound;
  }
  EXPECT_TRUE(threw);

  fs::create_directories(base / "Empty" / "advancements");
  RepairReport report = fix_save({"Empty", base / "Empty"}, kUuid);
  EXPECT_EQ(report.renamed(), static_cast<size_t>(0));
  EXPECT_EQ(report.skipped(), static_cast<size_t>(0));
  EXPECT_EQ(report.failed(), static_cast<size_t>(0));
  for (const auto &result : report.categories) {
    EXPECT_TRUE(result.outcome == RepairOutcome::Missing);
  }

  std::error_code ec;
  fs::remove_all(base, ec);
}

static void TestReportJson()
{
  using namespace uuidfix;

  const fs::path save = MakeTempDir("uuidfix_repair_json") / "World";
  WriteAged(save / "stats" / "old.json", 5s);

  RepairReport report = fix_save({"World", save}, kUuid);
  json::Value root = report.to_json();
  EXPECT_EQ(root.find("uuid")->as_string(), kUuid);
  EXPECT_EQ(root.find("renamed")->as_number(), 1.0);
  ASSERT_TRUE(root.find("categories")->is_array());
  EXPECT_EQ(root.find("categories")->size(), static_cast<size_t>(3));
  EXPECT_EQ(root.find("categories")->items()[1].find("outcome")->as_string(),
            std::string("renamed"));

  std::error_code ec;
  fs::remove_all(save.parent_path(), ec);
}

int main()
{
  TestRenamesLatestFilePerCategory();
  TestSecondRunIsIdempotent();
  TestWrongExtensionIsSkippedWithWarning();
  TestExistingTargetIsNotOverwritten();
  TestMissingSaveAndEmptyCategories();
  TestReportJson();

  return FinishTests("uuidfix_repair_tests");
}
