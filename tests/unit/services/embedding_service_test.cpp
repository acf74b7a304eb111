#include "recall_core/services/embedding_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using recall_tests::kTestDimension;

namespace recall_core {

class EmbeddingServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_client_ = std::make_shared<::testing::NiceMock<recall_tests::MockOllamaClient>>();
    EmbeddingConfig config;
    config.dimension = kTestDimension;
    config.batch_size = 2;
    service_ = std::make_unique<EmbeddingService>(mock_client_, config);
  }

  std::shared_ptr<::testing::NiceMock<recall_tests::MockOllamaClient>> mock_client_;
  std::unique_ptr<EmbeddingService> service_;
};

TEST(EmbeddingFormatTest, JoinsTitlePathAndContentInOrder) {
  std::string text =
      EmbeddingService::format_unit_text("Ship it", "Release Plan", {"Q3", "Milestones"});
  EXPECT_EQ(text, "Page: Release Plan\nPath: Q3 > Milestones\nContent: Ship it");
}

TEST(EmbeddingFormatTest, OmitsEmptyParts) {
  EXPECT_EQ(EmbeddingService::format_unit_text("Just text", "", {}), "Content: Just text");
  EXPECT_EQ(EmbeddingService::format_unit_text("Top level", "Inbox", {}),
            "Page: Inbox\nContent: Top level");

  UnitSnapshot unit = recall_tests::TestUtilities::make_unit("b1", "Nested", 1, "", "p", "x");
  unit.ancestor_texts = {"Parent"};
  EXPECT_EQ(EmbeddingService::format_unit_text(unit), "Path: Parent\nContent: Nested");
}

TEST_F(EmbeddingServiceTest, Embed_ReturnsClientVector) {
  Vector expected = recall_tests::TestUtilities::axis_vector(3);
  EXPECT_CALL(*mock_client_, get_embedding("hello")).WillOnce(Return(expected));

  EXPECT_EQ(service_->embed("hello"), expected);
}

TEST_F(EmbeddingServiceTest, EmbedBatch_PreservesOrderAndMatchesSingleEmbedding) {
  auto fake = std::make_shared<recall_tests::FakeOllamaClient>();
  EmbeddingConfig config;
  config.dimension = kTestDimension;
  config.batch_size = 2;
  EmbeddingService service(fake, config);

  std::vector<std::string> texts = {"one", "two", "three", "four", "five"};
  auto batch = service.embed_batch(texts);

  ASSERT_EQ(batch.size(), texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    EXPECT_EQ(batch[i], service.embed(texts[i])) << "Mismatch at " << i;
  }
  EXPECT_EQ(service.embed("one"), service.embed("one"));
}

TEST_F(EmbeddingServiceTest, EmbedBatch_EmptyInputDoesNotTouchServer) {
  EXPECT_CALL(*mock_client_, is_server_available()).Times(0);
  EXPECT_CALL(*mock_client_, get_embedding(_)).Times(0);
  EXPECT_TRUE(service_->embed_batch({}).empty());
}

TEST_F(EmbeddingServiceTest, ServerDown_ThrowsModelUnavailable) {
  EXPECT_CALL(*mock_client_, is_server_available()).WillRepeatedly(Return(false));
  EXPECT_CALL(*mock_client_, get_embedding(_)).Times(0);

  EXPECT_THROW(service_->embed("anything"), ModelUnavailableError);
}

TEST_F(EmbeddingServiceTest, MissingModel_ThrowsModelUnavailable) {
  EXPECT_CALL(*mock_client_, load_model()).WillRepeatedly(Return(false));
  EXPECT_THROW(service_->embed_batch({"a", "b"}), ModelUnavailableError);
}

TEST_F(EmbeddingServiceTest, LoadModelError_IsReportedAsModelUnavailable) {
  EXPECT_CALL(*mock_client_, load_model()).WillOnce(Throw(OllamaError("pull required")));
  EXPECT_THROW(service_->ensure_ready(), ModelUnavailableError);
}

TEST_F(EmbeddingServiceTest, ReadinessIsCheckedOnce) {
  EXPECT_CALL(*mock_client_, is_server_available()).Times(1).WillOnce(Return(true));
  EXPECT_CALL(*mock_client_, load_model()).Times(1).WillOnce(Return(true));

  service_->embed("a");
  service_->embed("b");
  service_->embed_batch({"c", "d", "e"});
}

TEST_F(EmbeddingServiceTest, WrongDimensionFromModel_ThrowsEmbeddingError) {
  EXPECT_CALL(*mock_client_, get_embedding(_)).WillOnce(Return(Vector(kTestDimension + 3, 0.1f)));
  try {
    service_->embed("x");
    FAIL() << "Expected EmbeddingError";
  } catch (const ModelUnavailableError &) {
    FAIL() << "A dimension mismatch is not a model load failure";
  } catch (const EmbeddingError &e) {
    EXPECT_NE(std::string(e.what()).find("expected 8"), std::string::npos) << e.what();
  }
}

TEST_F(EmbeddingServiceTest, ClientError_IsWrappedAsEmbeddingError) {
  EXPECT_CALL(*mock_client_, get_embedding(_)).WillOnce(Throw(OllamaError("boom")));
  EXPECT_THROW(service_->embed("x"), EmbeddingError);
}

TEST(EmbeddingServiceConfigTest, RejectsInvalidConfig) {
  auto client = std::make_shared<recall_tests::FakeOllamaClient>();
  EmbeddingConfig zero_batch;
  zero_batch.batch_size = 0;
  EXPECT_THROW(EmbeddingService(client, zero_batch), std::invalid_argument);
  EXPECT_THROW(EmbeddingService(nullptr, EmbeddingConfig{}), std::invalid_argument);
}

}  // namespace recall_core
