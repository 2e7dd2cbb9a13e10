#include "test_support.hpp"

#include "change_resolver.hpp"

class ChangeResolverTest : public TempDirTest {
  protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config = test_config(temp_dir);
        root   = temp_dir / "tree";
        fs::create_directories(root);
    }

    miner_config config;
    Path         root;
    FakeVcs      vcs;
};

TEST_F(ChangeResolverTest, FullScanWithoutPredecessor) {
    write_file(root / "src/Main.java", "class Main {}");
    write_file(root / "src/util/Util.java", "class Util {}");
    write_file(root / "README.md", "readme");
    write_file(root / ".git/hooks/Hook.java", "hidden");
    write_file(root / ".idea/Cached.java", "hidden");

    ChangeResolver resolver{vcs, &config, test_logger()};
    auto           changes = resolver.resolve(root, std::nullopt, "c1");

    EXPECT_TRUE(changes.full_scan);
    EXPECT_EQ(
        changes.changed,
        (std::set<Str>{"src/Main.java", "src/util/Util.java"}));
    EXPECT_TRUE(changes.removed.empty());
    EXPECT_EQ(vcs.diffs, 0);
}

TEST_F(ChangeResolverTest, DiffIsFilteredByExtension) {
    vcs.add_commit("c1", {{"A.java", "a"}, {"notes.txt", "x"}});
    vcs.add_commit(
        "c2", {{"A.java", "a2"}, {"notes.txt", "y"}, {"B.java", "b"}});
    write_file(root / "A.java", "a2");
    write_file(root / "B.java", "b");
    write_file(root / "notes.txt", "y");

    ChangeResolver resolver{vcs, &config, test_logger()};
    auto           changes = resolver.resolve(root, Str{"c1"}, "c2");

    EXPECT_FALSE(changes.full_scan);
    EXPECT_EQ(changes.changed, (std::set<Str>{"A.java", "B.java"}));
    EXPECT_TRUE(changes.removed.empty());
}

TEST_F(ChangeResolverTest, RemovedFilesAreReported) {
    vcs.add_commit("c1", {{"A.java", "a"}, {"B.java", "b"}});
    vcs.add_commit("c2", {{"A.java", "a"}});
    write_file(root / "A.java", "a");

    ChangeResolver resolver{vcs, &config, test_logger()};
    auto           changes = resolver.resolve(root, Str{"c1"}, "c2");

    EXPECT_TRUE(changes.changed.empty());
    EXPECT_EQ(changes.removed, (std::set<Str>{"B.java"}));
}

TEST_F(ChangeResolverTest, ChangedPathMissingFromTreeIsRemoved) {
    vcs.add_commit("c1", {{"A.java", "a"}});
    vcs.add_commit("c2", {{"A.java", "a2"}, {"Gone.java", "g"}});
    // Tree does not contain `Gone.java`
    write_file(root / "A.java", "a2");

    ChangeResolver resolver{vcs, &config, test_logger()};
    auto           changes = resolver.resolve(root, Str{"c1"}, "c2");

    EXPECT_EQ(changes.changed, (std::set<Str>{"A.java"}));
    EXPECT_EQ(changes.removed, (std::set<Str>{"Gone.java"}));
}

TEST_F(ChangeResolverTest, DiffFailureFallsBackToFullScan) {
    vcs.add_commit("c1", {{"A.java", "a"}});
    vcs.add_commit("c2", {{"A.java", "a2"}, {"B.java", "b"}});
    vcs.fail_diff(true);
    write_file(root / "A.java", "a2");
    write_file(root / "B.java", "b");

    ChangeResolver resolver{vcs, &config, test_logger()};
    auto           changes = resolver.resolve(root, Str{"c1"}, "c2");

    EXPECT_TRUE(changes.full_scan);
    EXPECT_EQ(changes.changed, (std::set<Str>{"A.java", "B.java"}));
}

TEST_F(ChangeResolverTest, CustomExtension) {
    config.extension = ".kt";
    write_file(root / "Main.kt", "fun main() {}");
    write_file(root / "Main.java", "class Main {}");
    // Extension alone is not a source file name
    write_file(root / ".kt", "");

    ChangeResolver resolver{vcs, &config, test_logger()};
    EXPECT_EQ(resolver.full_scan(root).changed, (std::set<Str>{"Main.kt"}));
}
