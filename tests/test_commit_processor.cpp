#include "test_support.hpp"

#include "commit_processor.hpp"
#include "json_file.hpp"

class CommitProcessorTest : public TempDirTest {
  protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config = test_config(temp_dir);
        fs::create_directories(config.output_dir);

        pool = std::make_unique<WorktreePool>(
            vcs,
            config.worktree_dir(),
            1,
            RetryPolicy{.attempts = 2, .initial_delay = sc::milliseconds{1}},
            test_logger());
        resolver = std::make_unique<ChangeResolver>(
            vcs, &config, test_logger());
        cache = std::make_unique<ContentCache>(
            config.cache_file(), test_logger());
        store = std::make_unique<ResultStore>(config.results_dir());
        processor = std::make_unique<CommitProcessor>(
            &config,
            vcs,
            *pool,
            *resolver,
            *cache,
            analyzer,
            *store,
            progress,
            test_logger());
    }

    void TearDown() override {
        pool->shutdown();
        TempDirTest::TearDown();
    }

    /// Start the pool after the history is defined
    void init() { pool->init(vcs.order.front()); }

    CommitOutcome process(int index) {
        return processor->process(
            ir::CommitTask{
                .commit = vcs.order.at(index), .index = index, .slot = 0},
            lineage);
    }

    ir::CommitRecord record(int index) {
        return read_json_file(store->success_path(vcs.order.at(index)))
            .get<ir::CommitRecord>();
    }

    miner_config             config;
    FakeVcs                  vcs;
    CountingAnalyzer         analyzer;
    ProgressCounter          progress;
    Lineage                  lineage;
    UPtr<WorktreePool>       pool;
    UPtr<ChangeResolver>     resolver;
    UPtr<ContentCache>       cache;
    UPtr<ResultStore>        store;
    UPtr<CommitProcessor>    processor;
};

TEST_F(CommitProcessorTest, FirstCommitAnalyzesWholeTree) {
    vcs.add_commit(
        "c1",
        {{"A.java", "VIOLATION:UnusedImports\nVIOLATION:EmptyCatchBlock"},
         {"B.java", "class B {}"},
         {"build.gradle", "VIOLATION:NotJava"}});
    init();

    auto outcome = process(0);
    EXPECT_EQ(outcome.state, ir::CommitState::Recorded);

    ASSERT_EQ(analyzer.calls.size(), 1u);
    EXPECT_EQ(analyzer.calls[0], (Vec<Str>{"A.java", "B.java"}));

    auto rec = record(0);
    EXPECT_TRUE(rec.full_scan);
    EXPECT_EQ(rec.num_source_files, 2);
    EXPECT_EQ(rec.num_violations, 2);
    EXPECT_EQ(rec.analyzed_files, 2);
    EXPECT_EQ(rec.violations_by_rule.at("UnusedImports"), 1);
    EXPECT_EQ(rec.violations_by_rule.at("EmptyCatchBlock"), 1);
    EXPECT_EQ(lineage.base_commit, Str{"c1"});
}

TEST_F(CommitProcessorTest, SingleChangedFileIsTheOnlyAnalyzerQuery) {
    vcs.add_commit(
        "c1",
        {{"A.java", "class A {}"},
         {"B.java", "VIOLATION:UnusedImports"},
         {"C.java", "class C {}"}});
    vcs.add_commit(
        "c2",
        {{"A.java", "class A {}"},
         {"B.java", "class B {}"},
         {"C.java", "class C {}"}});
    init();

    process(0);
    process(1);

    ASSERT_EQ(analyzer.calls.size(), 2u);
    EXPECT_EQ(analyzer.calls[1], (Vec<Str>{"B.java"}));

    auto rec = record(1);
    EXPECT_FALSE(rec.full_scan);
    EXPECT_EQ(rec.num_source_files, 3);
    EXPECT_EQ(rec.num_violations, 0);
    EXPECT_EQ(rec.analyzed_files, 1);
}

TEST_F(CommitProcessorTest, EmptyChangeSetReusesPreviousFindings) {
    vcs.add_commit(
        "c1", {{"A.java", "VIOLATION:UnusedImports"}, {"README", "v1"}});
    vcs.add_commit(
        "c2", {{"A.java", "VIOLATION:UnusedImports"}, {"README", "v2"}});
    init();

    process(0);
    int calls_before = analyzer.call_count();
    auto outcome     = process(1);

    EXPECT_EQ(outcome.state, ir::CommitState::Recorded);
    EXPECT_EQ(analyzer.call_count(), calls_before);
    EXPECT_EQ(record(1).num_violations, record(0).num_violations);
    EXPECT_EQ(record(1).num_source_files, record(0).num_source_files);
    EXPECT_EQ(record(1).analyzed_files, 0);
}

TEST_F(CommitProcessorTest, RevertedContentIsServedFromCache) {
    vcs.add_commit("c1", {{"A.java", "VIOLATION:EmptyCatchBlock"}});
    vcs.add_commit("c2", {{"A.java", "class A {}"}});
    vcs.add_commit("c3", {{"A.java", "VIOLATION:EmptyCatchBlock"}});
    init();

    process(0);
    process(1);
    process(2);

    EXPECT_EQ(analyzer.call_count(), 2);
    auto rec = record(2);
    EXPECT_EQ(rec.cache_hits, 1);
    EXPECT_EQ(rec.analyzed_files, 0);
    EXPECT_EQ(rec.num_violations, 1);
}

TEST_F(CommitProcessorTest, RemovedFileLeavesTheCount) {
    vcs.add_commit(
        "c1", {{"A.java", "VIOLATION:Rule"}, {"B.java", "VIOLATION:Rule"}});
    vcs.add_commit("c2", {{"A.java", "VIOLATION:Rule"}});
    init();

    process(0);
    process(1);

    auto rec = record(1);
    EXPECT_EQ(rec.num_source_files, 1);
    EXPECT_EQ(rec.num_violations, 1);
    EXPECT_EQ(rec.violations_by_rule.at("Rule"), 1);
}

TEST_F(CommitProcessorTest, CommitWithoutSourceFilesHasEmptyRecord) {
    vcs.add_commit("c1", {{"README.md", "nothing to analyze"}});
    init();

    auto outcome = process(0);
    EXPECT_EQ(outcome.state, ir::CommitState::Recorded);
    EXPECT_EQ(analyzer.call_count(), 0);

    auto rec = record(0);
    EXPECT_EQ(rec.num_source_files, 0);
    EXPECT_EQ(rec.num_violations, 0);
    EXPECT_TRUE(rec.violations_by_rule.empty());
}

TEST_F(CommitProcessorTest, AnalysisFailureWritesErrorRecordAndResets) {
    vcs.add_commit("c1", {{"A.java", "class A {}"}});
    vcs.add_commit("c2", {{"A.java", "class A { int x; }"}});
    vcs.add_commit("c3", {{"A.java", "class A { int y; }"}});
    init();

    process(0);
    analyzer.fail_once();
    auto failed = process(1);

    EXPECT_EQ(failed.state, ir::CommitState::Failed);
    EXPECT_EQ(failed.cause, ir::FailureCause::ExitStatus);
    EXPECT_TRUE(fs::exists(store->error_path("c2")));
    EXPECT_FALSE(fs::exists(store->success_path("c2")));
    ASSERT_EQ(vcs.resets.size(), 1u);
    EXPECT_EQ(vcs.resets[0].string(), pool->slot_path(0).string());

    auto error = read_json_file(store->error_path("c2"))
                     .get<ir::ErrorRecord>();
    EXPECT_EQ(error.kind, ir::ErrorKind::AnalysisError);
    EXPECT_EQ(error.cause, ir::FailureCause::ExitStatus);

    // Failed commit does not move the lineage, next diff starts from c1
    EXPECT_EQ(lineage.base_commit, Str{"c1"});
    EXPECT_EQ(process(2).state, ir::CommitState::Recorded);
    EXPECT_EQ(analyzer.calls.back(), (Vec<Str>{"A.java"}));
    EXPECT_FALSE(record(2).full_scan);
}

TEST_F(CommitProcessorTest, UnexpectedExceptionIsRecordedAsInternal) {
    vcs.add_commit("c1", {{"A.java", "class A {}"}});
    vcs.add_commit("c2", {{"A.java", "class A { int x; }"}});
    init();

    process(0);
    analyzer.throw_once();
    auto failed = process(1);

    EXPECT_EQ(failed.state, ir::CommitState::Failed);
    EXPECT_EQ(failed.cause, ir::FailureCause::Internal);
    ASSERT_TRUE(fs::exists(store->error_path("c2")));
    EXPECT_EQ(vcs.resets.size(), 1u);

    auto error = read_json_file(store->error_path("c2"))
                     .get<ir::ErrorRecord>();
    EXPECT_EQ(error.kind, ir::ErrorKind::AnalysisError);
    EXPECT_EQ(error.cause, ir::FailureCause::Internal);
    EXPECT_NE(error.message.find("unexpected report layout"), Str::npos);

    EXPECT_EQ(lineage.base_commit, Str{"c1"});
    EXPECT_EQ(progress.count(ir::CommitState::Failed), 1);
}

TEST_F(CommitProcessorTest, FailedRecordWriteLeavesErrorRecord) {
    vcs.add_commit("c1", {{"A.java", "class A {}"}});
    init();

    // Temporary file of the success record cannot be created
    fs::create_directories(store->success_path("c1").string() + ".tmp");

    auto failed = process(0);

    EXPECT_EQ(failed.state, ir::CommitState::Failed);
    EXPECT_EQ(failed.cause, ir::FailureCause::Internal);
    EXPECT_FALSE(fs::exists(store->success_path("c1")));
    EXPECT_TRUE(fs::exists(store->error_path("c1")));
    EXPECT_EQ(vcs.resets.size(), 1u);
    EXPECT_FALSE(lineage.base_commit.has_value());
}

TEST_F(CommitProcessorTest, CheckoutFailureWritesErrorRecord) {
    vcs.add_commit("c1", {{"A.java", "class A {}"}});
    vcs.add_commit("c2", {{"A.java", "class A { int x; }"}});
    vcs.add_commit("c3", {{"A.java", "class A { int y; }"}});
    vcs.fail_checkout("c2");
    init();

    process(0);
    auto failed = process(1);

    EXPECT_EQ(failed.state, ir::CommitState::Failed);
    EXPECT_EQ(failed.cause, ir::FailureCause::CheckoutStatus);
    auto error = read_json_file(store->error_path("c2"))
                     .get<ir::ErrorRecord>();
    EXPECT_EQ(error.kind, ir::ErrorKind::CheckoutError);
    EXPECT_NE(error.message.find("did not match any"), Str::npos);

    EXPECT_EQ(process(2).state, ir::CommitState::Recorded);
    EXPECT_EQ(progress.count(ir::CommitState::Failed), 1);
    EXPECT_EQ(progress.count(ir::CommitState::Recorded), 2);
}

TEST_F(CommitProcessorTest, ExistingRecordIsSkipped) {
    vcs.add_commit("c1", {{"A.java", "class A {}"}});
    init();

    process(0);
    int  checkouts = vcs.checkout_count("c1");
    auto again     = process(0);

    EXPECT_EQ(again.state, ir::CommitState::Skipped);
    EXPECT_EQ(vcs.checkout_count("c1"), checkouts);
    EXPECT_EQ(analyzer.call_count(), 1);
    EXPECT_EQ(progress.count(ir::CommitState::Skipped), 1);
}

TEST_F(CommitProcessorTest, EveryTransitionIsCounted) {
    vcs.add_commit("c1", {{"A.java", "class A {}"}});
    init();

    process(0);
    EXPECT_EQ(progress.count(ir::CommitState::CheckedOut), 1);
    EXPECT_EQ(progress.count(ir::CommitState::Resolved), 1);
    EXPECT_EQ(progress.count(ir::CommitState::Analyzed), 1);
    EXPECT_EQ(progress.count(ir::CommitState::Recorded), 1);
    EXPECT_EQ(progress.finished(), 1);
}
