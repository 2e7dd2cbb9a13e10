#include "test_support.hpp"

#include "worktree_pool.hpp"

class WorktreePoolTest : public TempDirTest {
  protected:
    void SetUp() override {
        TempDirTest::SetUp();
        root = temp_dir / "worktrees";
        vcs.add_commit("c1", {{"A.java", "v1"}});
        vcs.add_commit("c2", {{"A.java", "v2"}});
    }

    UPtr<WorktreePool> make_pool(int size, int attempts = 3) {
        return std::make_unique<WorktreePool>(
            vcs,
            root,
            size,
            RetryPolicy{
                .attempts = attempts, .initial_delay = sc::milliseconds{1}},
            test_logger());
    }

    Path    root;
    FakeVcs vcs;
};

TEST_F(WorktreePoolTest, SlotsHaveDistinctPaths) {
    auto pool = make_pool(3);
    pool->init("c1");

    ASSERT_EQ(pool->size(), 3);
    std::set<Path> paths;
    for (int i = 0; i < pool->size(); ++i) {
        paths.insert(pool->slot_path(i));
        EXPECT_TRUE(fs::exists(pool->slot_path(i) / "A.java"));
        EXPECT_EQ(read_file(pool->slot_path(i) / "A.java"), "v1");
    }

    EXPECT_EQ(paths.size(), 3u);
    EXPECT_EQ(vcs.added.size(), 3u);
}

TEST_F(WorktreePoolTest, StaleSlotsAreRemoved) {
    write_file(root / "wt_0" / "leftover.txt", "old run");
    write_file(root / "wt_7" / "leftover.txt", "larger pool");
    write_file(root / "unrelated" / "keep.txt", "not a slot");

    auto pool = make_pool(2);
    pool->init("c1");

    EXPECT_FALSE(fs::exists(root / "wt_0" / "leftover.txt"));
    EXPECT_FALSE(fs::exists(root / "wt_7"));
    EXPECT_TRUE(fs::exists(root / "unrelated" / "keep.txt"));
    EXPECT_EQ(vcs.removed.size(), 2u);
    EXPECT_GE(vcs.prunes, 1);
}

TEST_F(WorktreePoolTest, CheckoutReplacesTreeContent) {
    auto pool = make_pool(1);
    pool->init("c1");

    auto lease = pool->acquire(0);
    pool->checkout(lease, "c2");
    EXPECT_EQ(lease->commit, "c2");
    EXPECT_EQ(read_file(pool->slot_path(0) / "A.java"), "v2");
}

TEST_F(WorktreePoolTest, LockArtifactIsRemovedBeforeRetry) {
    auto pool = make_pool(1);
    pool->init("c1");
    Path lock = temp_dir / "git" / "index.lock";
    vcs.fail_with_lock("c2", 2, lock);

    auto lease = pool->acquire(0);
    pool->checkout(lease, "c2");

    EXPECT_EQ(vcs.checkout_count("c2"), 3);
    EXPECT_FALSE(fs::exists(lock));
    EXPECT_EQ(lease->commit, "c2");
}

TEST_F(WorktreePoolTest, RetriesAreBounded) {
    auto pool = make_pool(1, 2);
    pool->init("c1");
    vcs.fail_with_lock("c2", 5, temp_dir / "git" / "index.lock");

    auto lease = pool->acquire(0);
    EXPECT_THROW(pool->checkout(lease, "c2"), checkout_error);
    EXPECT_EQ(vcs.checkout_count("c2"), 2);
    // Tree state is unknown after the failure
    EXPECT_TRUE(lease->commit.empty());
}

TEST_F(WorktreePoolTest, PermanentFailureIsNotRetried) {
    auto pool = make_pool(1, 5);
    pool->init("c1");
    vcs.fail_checkout("c2");

    auto lease = pool->acquire(0);
    try {
        pool->checkout(lease, "c2");
        FAIL() << "checkout succeeded";
    } catch (checkout_error& err) {
        EXPECT_NE(err.stderr_text.find("did not match any"), Str::npos);
    }

    EXPECT_EQ(vcs.checkout_count("c2"), 1);
}

TEST_F(WorktreePoolTest, ResetDelegatesToVcs) {
    auto pool = make_pool(1);
    pool->init("c1");

    auto lease = pool->acquire(0);
    EXPECT_TRUE(pool->reset(lease));
    ASSERT_EQ(vcs.resets.size(), 1u);
    EXPECT_EQ(vcs.resets[0].string(), pool->slot_path(0).string());
}

TEST_F(WorktreePoolTest, ShutdownRemovesEverySlot) {
    auto pool = make_pool(2);
    pool->init("c1");
    Vec<Path> paths{pool->slot_path(0), pool->slot_path(1)};

    pool->shutdown();
    EXPECT_EQ(pool->size(), 0);
    EXPECT_EQ(vcs.removed.size(), 2u);
    for (const auto& path : paths) { EXPECT_FALSE(fs::exists(path)); }

    // Destructor does not repeat the teardown
    pool.reset();
    EXPECT_EQ(vcs.removed.size(), 2u);
}

TEST_F(WorktreePoolTest, DestructorTearsDownActivePool) {
    {
        auto pool = make_pool(2);
        pool->init("c1");
    }

    EXPECT_EQ(vcs.removed.size(), 2u);
    EXPECT_FALSE(fs::exists(root / "wt_0"));
}
