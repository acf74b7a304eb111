#include "recall_core/services/sync_coordinator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace recall_tests {

using recall_core::SyncOutcome;
using recall_core::SyncPhase;
using recall_core::SyncResult;
using recall_core::SyncStatus;

class SyncCoordinatorTest : public VectorStoreTestBase {
 protected:
  void SetUp() override {
    VectorStoreTestBase::SetUp();
    // Swap in a store whose writes can be made to fail
    vector_store_.reset();
    failing_store_ = std::make_shared<FailingVectorStore>(*db_manager_, store_options());
    vector_store_ = failing_store_;

    graph_ = std::make_shared<FakeGraphClient>();
    ollama_ = std::make_shared<FakeOllamaClient>();
    recall_core::EmbeddingConfig embedding_config;
    embedding_config.dimension = kTestDimension;
    embedding_config.batch_size = 2;
    embedding_ = std::make_shared<recall_core::EmbeddingService>(ollama_, embedding_config);
    make_coordinator(recall_core::SyncConfig{});
  }

  void TearDown() override {
    coordinator_.reset();
    failing_store_.reset();
    VectorStoreTestBase::TearDown();
  }

  void make_coordinator(recall_core::SyncConfig config) {
    coordinator_ = std::make_unique<recall_core::SyncCoordinator>(graph_, embedding_,
                                                                  vector_store_, config);
  }

  std::shared_ptr<FakeGraphClient> graph_;
  std::shared_ptr<FakeOllamaClient> ollama_;
  std::shared_ptr<recall_core::EmbeddingService> embedding_;
  std::shared_ptr<FailingVectorStore> failing_store_;
  std::unique_ptr<recall_core::SyncCoordinator> coordinator_;
};

TEST_F(SyncCoordinatorTest, FullSync_EmbedsEveryUnitAndRecordsWatermark) {
  graph_->put_all(TestUtilities::make_units(3));

  SyncResult result = coordinator_->full_sync();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(result.units_processed, 3u);
  EXPECT_FALSE(result.cancelled);
  EXPECT_EQ(result.new_watermark.value_or(-1), 300);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);
  EXPECT_EQ(vector_store_->sync_status(), SyncStatus::COMPLETED);
  EXPECT_EQ(vector_store_->count(), 3u);
  EXPECT_EQ(ollama_->calls(), 3);
  EXPECT_EQ(coordinator_->phase(), SyncPhase::IDLE);
}

TEST_F(SyncCoordinatorTest, IncrementalSync_ReembedsOnlyEditedUnits) {
  graph_->put_all(TestUtilities::make_units(3));
  coordinator_->full_sync();
  ollama_->clear_texts();

  graph_->put(TestUtilities::make_unit("block1", "block one rewritten", 400));
  SyncResult result = coordinator_->incremental_sync();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(result.units_processed, 1u);
  EXPECT_EQ(result.new_watermark.value_or(-1), 400);
  ASSERT_FALSE(graph_->modified_since_args.empty());
  EXPECT_EQ(graph_->modified_since_args.back(), 300);

  auto texts = ollama_->texts();
  ASSERT_EQ(texts.size(), 1u);
  EXPECT_NE(texts[0].find("block one rewritten"), std::string::npos);

  auto stored = vector_store_->get("block1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->content, "block one rewritten");
  EXPECT_EQ(stored->last_modified, 400);
  EXPECT_EQ(vector_store_->count(), 3u);
}

TEST_F(SyncCoordinatorTest, IncrementalSync_IsANoOpWhenNothingChanged) {
  graph_->put_all(TestUtilities::make_units(3));
  coordinator_->full_sync();
  const int calls_after_first = ollama_->calls();

  SyncResult again = coordinator_->incremental_sync();

  EXPECT_EQ(again.outcome, SyncOutcome::NoChanges);
  EXPECT_EQ(again.units_processed, 0u);
  EXPECT_EQ(again.new_watermark.value_or(-1), 300);
  EXPECT_EQ(ollama_->calls(), calls_after_first);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);
}

TEST_F(SyncCoordinatorTest, IncrementalSync_WithoutWatermarkFetchesWholeGraph) {
  graph_->put_all(TestUtilities::make_units(2));

  SyncResult result = coordinator_->incremental_sync();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(graph_->fetch_all_calls.load(), 1);
  EXPECT_EQ(graph_->fetch_modified_calls.load(), 0);
  EXPECT_EQ(vector_store_->count(), 2u);
}

TEST_F(SyncCoordinatorTest, EmptyGraph_ReportsNoChanges) {
  SyncResult result = coordinator_->full_sync();

  EXPECT_EQ(result.outcome, SyncOutcome::NoChanges);
  EXPECT_FALSE(result.new_watermark.has_value());
  EXPECT_EQ(ollama_->calls(), 0);
}

TEST_F(SyncCoordinatorTest, FullSync_NeverLowersWatermark) {
  vector_store_->set_last_sync_timestamp(1000);
  graph_->put_all(TestUtilities::make_units(3));

  SyncResult result = coordinator_->full_sync();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(result.units_processed, 3u);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 1000);
}

TEST_F(SyncCoordinatorTest, WatermarkAdvancesAfterEachSubBatch) {
  recall_core::SyncConfig config;
  config.commit_interval = 2;
  make_coordinator(config);
  graph_->put_all(TestUtilities::make_units(5));
  // Fail the last sub-batch for good
  failing_store_->fail_on_id = "block4";

  EXPECT_THROW(coordinator_->full_sync(), recall_core::StoreWriteError);

  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 400);
  EXPECT_EQ(vector_store_->count(), 4u);
  EXPECT_FALSE(vector_store_->get("block4").has_value());
  EXPECT_EQ(coordinator_->phase(), SyncPhase::IDLE);
}

TEST_F(SyncCoordinatorTest, SubBatchSplittingATimestamp_KeepsWatermarkBelowIt) {
  recall_core::SyncConfig config;
  config.commit_interval = 2;
  config.commit_retries = 1;
  make_coordinator(config);
  graph_->put(TestUtilities::make_unit("a", "first", 100));
  graph_->put(TestUtilities::make_unit("b", "second", 200));
  graph_->put(TestUtilities::make_unit("c", "third", 200));
  graph_->put(TestUtilities::make_unit("d", "fourth", 300));
  failing_store_->fail_on_id = "c";

  EXPECT_THROW(coordinator_->full_sync(), recall_core::StoreWriteError);

  // "b" is committed but "c" shares its timestamp, so 200 is not yet covered
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 199);
  EXPECT_TRUE(vector_store_->get("b").has_value());
  EXPECT_FALSE(vector_store_->get("c").has_value());
  EXPECT_FALSE(vector_store_->get("d").has_value());

  // Resuming picks up exactly what is missing
  failing_store_->fail_on_id.clear();
  SyncResult resumed = coordinator_->incremental_sync();

  EXPECT_EQ(graph_->modified_since_args.back(), 199);
  EXPECT_EQ(resumed.outcome, SyncOutcome::Completed);
  EXPECT_EQ(resumed.units_processed, 3u);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);
  EXPECT_EQ(vector_store_->count(), 4u);
}

TEST_F(SyncCoordinatorTest, TransientCommitFailure_IsRetried) {
  graph_->put_all(TestUtilities::make_units(3));
  failing_store_->failures_remaining = 1;

  SyncResult result = coordinator_->full_sync();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(vector_store_->count(), 3u);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);
  // One failed write, then the whole sub-batch again
  EXPECT_EQ(failing_store_->vector_writes.load(), 4);
}

TEST_F(SyncCoordinatorTest, CommitFailureBeyondRetries_AbortsWithoutAdvancing) {
  recall_core::SyncConfig config;
  config.commit_retries = 2;
  make_coordinator(config);
  graph_->put_all(TestUtilities::make_units(3));
  failing_store_->failures_remaining = 3;

  EXPECT_THROW(coordinator_->full_sync(), recall_core::StoreWriteError);

  EXPECT_FALSE(vector_store_->last_sync_timestamp().has_value());
  EXPECT_EQ(vector_store_->count(), 0u);
  EXPECT_EQ(failing_store_->vector_writes.load(), 3);
}

TEST_F(SyncCoordinatorTest, ExpiredDeadline_CancelsBeforeAnyWork) {
  graph_->put_all(TestUtilities::make_units(3));
  auto past = std::chrono::steady_clock::now() - std::chrono::seconds(1);

  SyncResult result = coordinator_->incremental_sync(past);

  EXPECT_EQ(result.outcome, SyncOutcome::Cancelled);
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.units_processed, 0u);
  EXPECT_EQ(ollama_->calls(), 0);
  EXPECT_EQ(vector_store_->count(), 0u);
  EXPECT_FALSE(vector_store_->last_sync_timestamp().has_value());
  EXPECT_EQ(vector_store_->sync_status(), SyncStatus::IN_PROGRESS);

  // A later run without a deadline finishes the job
  SyncResult later = coordinator_->incremental_sync();
  EXPECT_EQ(later.outcome, SyncOutcome::Completed);
  EXPECT_EQ(vector_store_->count(), 3u);
  EXPECT_EQ(vector_store_->sync_status(), SyncStatus::COMPLETED);
}

TEST_F(SyncCoordinatorTest, DeadlineMidSync_KeepsCommittedSubBatches) {
  recall_core::SyncConfig config;
  config.commit_interval = 1;
  make_coordinator(config);
  graph_->put_all(TestUtilities::make_units(4));
  // The second embedding outlasts the deadline
  ollama_->on_embedding = [](int call) {
    if (call == 2) {
      std::this_thread::sleep_for(std::chrono::milliseconds(300));
    }
  };
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(150);

  SyncResult result = coordinator_->incremental_sync(deadline);

  EXPECT_EQ(result.outcome, SyncOutcome::Cancelled);
  EXPECT_TRUE(result.cancelled);
  const size_t committed = result.units_processed;
  ASSERT_GE(committed, 1u);
  ASSERT_LT(committed, 4u);
  const int64_t covered = 100 * static_cast<int64_t>(committed);
  EXPECT_EQ(result.new_watermark.value_or(-1), covered);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), covered);
  EXPECT_EQ(vector_store_->count(), committed);
  EXPECT_EQ(vector_store_->sync_status(), SyncStatus::IN_PROGRESS);

  // Resuming embeds only what was not committed
  ollama_->on_embedding = nullptr;
  ollama_->clear_texts();
  SyncResult resumed = coordinator_->incremental_sync();

  EXPECT_EQ(resumed.outcome, SyncOutcome::Completed);
  EXPECT_EQ(graph_->modified_since_args.back(), covered);
  EXPECT_EQ(resumed.units_processed, 4u - committed);
  auto texts = ollama_->texts();
  EXPECT_EQ(texts.size(), 4u - committed);
  for (const auto& text : texts) {
    EXPECT_EQ(text.find("content of block0"), std::string::npos);
  }
  EXPECT_EQ(vector_store_->count(), 4u);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 400);
  EXPECT_EQ(vector_store_->sync_status(), SyncStatus::COMPLETED);
}

TEST_F(SyncCoordinatorTest, DeadlineStopsAncestorLookups) {
  for (int i = 0; i < 5; ++i) {
    graph_->put(TestUtilities::make_unit("deep" + std::to_string(i), "nested note", 100 + i,
                                         "Project", "page-1", "mid"));
  }
  graph_->ancestor_delay = std::chrono::milliseconds(200);
  auto started = std::chrono::steady_clock::now();

  SyncResult result = coordinator_->incremental_sync(started + std::chrono::milliseconds(100));
  auto waited = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(result.outcome, SyncOutcome::Cancelled);
  EXPECT_TRUE(result.cancelled);
  EXPECT_LT(graph_->ancestor_calls.load(), 5);
  EXPECT_LT(waited, std::chrono::milliseconds(5 * 200));
  EXPECT_EQ(ollama_->calls(), 0);
  EXPECT_EQ(vector_store_->count(), 0u);
  EXPECT_FALSE(vector_store_->last_sync_timestamp().has_value());
}

TEST_F(SyncCoordinatorTest, ConcurrentRequest_ReturnsAlreadyRunning) {
  graph_->put_all(TestUtilities::make_units(2));
  SyncResult nested;
  bool observed_running = false;
  SyncPhase observed_phase = SyncPhase::IDLE;
  bool fired = false;
  graph_->on_fetch = [&]() {
    if (fired)
      return;
    fired = true;
    observed_running = coordinator_->is_running();
    observed_phase = coordinator_->phase();
    nested = coordinator_->incremental_sync();
  };

  SyncResult outer = coordinator_->full_sync();

  EXPECT_EQ(outer.outcome, SyncOutcome::Completed);
  EXPECT_EQ(nested.outcome, SyncOutcome::AlreadyRunning);
  EXPECT_EQ(nested.units_processed, 0u);
  EXPECT_TRUE(observed_running);
  EXPECT_EQ(observed_phase, SyncPhase::DIFFING);
  EXPECT_EQ(graph_->fetch_all_calls.load(), 1);
  EXPECT_EQ(ollama_->calls(), 2);
  EXPECT_FALSE(coordinator_->is_running());
}

TEST_F(SyncCoordinatorTest, AncestorChainIsFetchedForNestedUnits) {
  graph_->put(TestUtilities::make_unit("top", "top level note", 100));
  graph_->put(TestUtilities::make_unit("deep", "nested note", 200, "Project", "page-1", "mid"));
  graph_->set_ancestors("deep", {"Goals", "Q3"});

  coordinator_->full_sync();

  EXPECT_EQ(graph_->ancestor_calls.load(), 1);
  bool found = false;
  for (const auto& text : ollama_->texts()) {
    if (text.find("nested note") != std::string::npos) {
      found = true;
      EXPECT_EQ(text, "Page: Project\nPath: Goals > Q3\nContent: nested note");
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(SyncCoordinatorTest, AncestorLookupFailure_EmbedsWithoutContext) {
  graph_->put(TestUtilities::make_unit("deep", "nested note", 200, "Project", "page-1", "mid"));
  graph_->fail_ancestors = true;

  SyncResult result = coordinator_->full_sync();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  auto texts = ollama_->texts();
  ASSERT_EQ(texts.size(), 1u);
  EXPECT_EQ(texts[0], "Page: Project\nContent: nested note");
}

TEST_F(SyncCoordinatorTest, SourceFailure_LeavesStoreUntouched) {
  graph_->put_all(TestUtilities::make_units(3));
  coordinator_->full_sync();
  graph_->put(TestUtilities::make_unit("block0", "changed", 900));
  graph_->fail_next_fetches(1);

  EXPECT_THROW(coordinator_->incremental_sync(), recall_core::SourceUnreachableError);

  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);
  EXPECT_EQ(vector_store_->get("block0")->content, "content of block0");
  EXPECT_FALSE(coordinator_->is_running());
}

TEST_F(SyncCoordinatorTest, ModelUnavailable_StopsSyncWithoutProgress) {
  graph_->put_all(TestUtilities::make_units(3));
  ollama_->available_ = false;

  EXPECT_THROW(coordinator_->full_sync(), recall_core::ModelUnavailableError);

  EXPECT_EQ(vector_store_->count(), 0u);
  EXPECT_FALSE(vector_store_->last_sync_timestamp().has_value());
  EXPECT_EQ(ollama_->calls(), 0);
}

TEST_F(SyncCoordinatorTest, ReconcileDeletions_RemovesUnitsGoneFromSource) {
  graph_->put_all(TestUtilities::make_units(3));
  coordinator_->full_sync();
  graph_->erase("block1");

  SyncResult result = coordinator_->reconcile_deletions();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(result.units_processed, 1u);
  EXPECT_FALSE(vector_store_->get("block1").has_value());
  EXPECT_EQ(vector_store_->count(), 2u);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);

  EXPECT_EQ(coordinator_->reconcile_deletions().outcome, SyncOutcome::NoChanges);
}

TEST_F(SyncCoordinatorTest, Rebuild_ResetsWatermarkAndRepopulates) {
  graph_->put_all(TestUtilities::make_units(3));
  coordinator_->full_sync();
  vector_store_->set_last_sync_timestamp(5000);
  graph_->erase("block2");

  SyncResult result = coordinator_->rebuild();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(result.units_processed, 2u);
  EXPECT_EQ(vector_store_->count(), 2u);
  EXPECT_FALSE(vector_store_->get("block2").has_value());
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 200);
}

TEST_F(SyncCoordinatorTest, Rebuild_SourceFailureKeepsOldIndex) {
  graph_->put_all(TestUtilities::make_units(3));
  coordinator_->full_sync();
  graph_->fail_next_fetches(1);

  EXPECT_THROW(coordinator_->rebuild(), recall_core::SourceUnreachableError);

  EXPECT_EQ(vector_store_->count(), 3u);
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);
}

TEST_F(SyncCoordinatorTest, Rebuild_WrongModelDimensionKeepsOldIndex) {
  graph_->put_all(TestUtilities::make_units(3));
  coordinator_->full_sync();

  auto wrong_model = std::make_shared<FakeOllamaClient>(kTestDimension + 1);
  recall_core::EmbeddingConfig embedding_config;
  embedding_config.dimension = kTestDimension;
  embedding_config.batch_size = 2;
  auto embedding = std::make_shared<recall_core::EmbeddingService>(wrong_model, embedding_config);
  recall_core::SyncCoordinator rebuilding(graph_, embedding, vector_store_);

  EXPECT_THROW(rebuilding.rebuild(), recall_core::EmbeddingError);

  EXPECT_EQ(vector_store_->count(), 3u);
  EXPECT_TRUE(vector_store_->get("block0").has_value());
  EXPECT_EQ(vector_store_->last_sync_timestamp().value_or(-1), 300);
}

TEST_F(SyncCoordinatorTest, Rebuild_OfEmptyGraphClearsStore) {
  graph_->put_all(TestUtilities::make_units(2));
  coordinator_->full_sync();
  graph_->erase("block0");
  graph_->erase("block1");

  SyncResult result = coordinator_->rebuild();

  EXPECT_EQ(result.outcome, SyncOutcome::Completed);
  EXPECT_EQ(vector_store_->count(), 0u);
  EXPECT_FALSE(vector_store_->last_sync_timestamp().has_value());
}

TEST_F(SyncCoordinatorTest, Constructor_RejectsInvalidConfig) {
  recall_core::SyncConfig zero_interval;
  zero_interval.commit_interval = 0;
  EXPECT_THROW(recall_core::SyncCoordinator(graph_, embedding_, vector_store_, zero_interval),
               std::invalid_argument);

  recall_core::SyncConfig negative_retries;
  negative_retries.commit_retries = -1;
  EXPECT_THROW(recall_core::SyncCoordinator(graph_, embedding_, vector_store_, negative_retries),
               std::invalid_argument);

  EXPECT_THROW(recall_core::SyncCoordinator(nullptr, embedding_, vector_store_),
               std::invalid_argument);
}

TEST(SyncEnumsTest, ToString) {
  EXPECT_EQ(recall_core::to_string(SyncOutcome::AlreadyRunning), "already_running");
  EXPECT_EQ(recall_core::to_string(SyncOutcome::NoChanges), "no_changes");
  EXPECT_EQ(recall_core::to_string(SyncPhase::COMMITTING), "committing");
}

}  // namespace recall_tests
