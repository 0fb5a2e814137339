#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/index/flat_vector_index.hpp"
#include "sage_core/services/document_identity.hpp"
#include "sage_core/services/ingestion_pipeline.hpp"

namespace sage_core {

using sage_tests::ControlledEmbedder;
using sage_tests::MockEmbedder;
using sage_tests::MockStateStore;
using sage_tests::TestUtilities;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class IngestionPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    embedder_ = std::make_shared<ControlledEmbedder>(4);
    pipeline_ = std::make_unique<IngestionPipeline>(TextChunker(ChunkingPolicy{10, 2}), embedder_);
  }

  std::shared_ptr<ControlledEmbedder> embedder_;
  std::unique_ptr<IngestionPipeline> pipeline_;
  FlatVectorIndex index_;
  CorpusStore corpus_;
};

TEST_F(IngestionPipelineTest, PrepareChunksAndEmbedsInOneBatch) {
  PreparedDocument prepared = pipeline_->prepare("doc1", "abcdefghijklmnopqrst");

  ASSERT_EQ(prepared.chunks.size(), 3u);
  EXPECT_EQ(prepared.chunks[0].content, "abcdefghij");
  EXPECT_EQ(prepared.chunks[1].content, "ijklmnopqr");
  EXPECT_EQ(prepared.chunks[2].content, "qrst");
  for (size_t i = 0; i < prepared.chunks.size(); ++i) {
    EXPECT_EQ(prepared.chunks[i].document_id, "doc1");
    EXPECT_EQ(prepared.chunks[i].chunk_index, static_cast<int>(i));
  }
  EXPECT_EQ(prepared.vectors.size(), 3u);
  EXPECT_EQ(embedder_->embed_calls(), 1u);

  EXPECT_EQ(prepared.info.document_id, "doc1");
  EXPECT_EQ(prepared.info.chunk_count, 3u);
  EXPECT_EQ(prepared.info.content_hash, compute_content_hash("abcdefghijklmnopqrst"));
}

TEST_F(IngestionPipelineTest, BlankTextIsEmptyDocument) {
  EXPECT_THROW(pipeline_->prepare("doc1", ""), EmptyDocumentError);
  EXPECT_THROW(pipeline_->prepare("doc1", " \n\t "), EmptyDocumentError);
  EXPECT_EQ(embedder_->embed_calls(), 0u);
}

TEST_F(IngestionPipelineTest, BlankIdIsInvalidArgument) {
  EXPECT_THROW(pipeline_->prepare("", "text"), InvalidArgumentError);
}

TEST_F(IngestionPipelineTest, EmbedderDroppingVectorsIsModelFailure) {
  auto embedder = std::make_shared<MockEmbedder>();
  EXPECT_CALL(*embedder, embed(_))
      .WillOnce(Return(std::vector<std::vector<float>>{{1, 0, 0, 0}}));
  IngestionPipeline pipeline(TextChunker(ChunkingPolicy{10, 2}), embedder);

  EXPECT_THROW(pipeline.prepare("doc1", "abcdefghijklmnopqrst"), ModelError);
}

TEST_F(IngestionPipelineTest, CommitGrowsIndexAndCorpusTogether) {
  auto first = pipeline_->prepare("doc1", "abcdefghijklmnopqrst");
  auto positions = pipeline_->commit(first, index_, corpus_);
  EXPECT_EQ(positions, (std::vector<int64_t>{0, 1, 2}));

  auto second = pipeline_->prepare("doc2", "short");
  positions = pipeline_->commit(second, index_, corpus_);
  EXPECT_EQ(positions, (std::vector<int64_t>{3}));

  EXPECT_EQ(index_.size(), 4u);
  EXPECT_EQ(corpus_.size(), 4u);
  EXPECT_EQ(corpus_.get(3).document_id, "doc2");
  EXPECT_EQ(corpus_.documents().size(), 2u);
}

TEST_F(IngestionPipelineTest, CommitRejectsDuplicateWithoutChangingState) {
  auto prepared = pipeline_->prepare("doc1", "some text");
  pipeline_->commit(prepared, index_, corpus_);

  EXPECT_THROW(pipeline_->commit(prepared, index_, corpus_), DuplicateDocumentError);
  EXPECT_EQ(index_.size(), 1u);
  EXPECT_EQ(corpus_.size(), 1u);
  EXPECT_EQ(corpus_.documents().size(), 1u);
}

TEST_F(IngestionPipelineTest, FailedInsertRollsBackDocumentRecord) {
  pipeline_->commit(pipeline_->prepare("doc1", "some text"), index_, corpus_);

  // Vectors of the wrong width are rejected by the index after the document was recorded
  PreparedDocument bad = pipeline_->prepare("doc2", "other text");
  bad.vectors = {{1, 2}};
  EXPECT_THROW(pipeline_->commit(bad, index_, corpus_), DimensionMismatchError);

  EXPECT_EQ(index_.size(), 1u);
  EXPECT_EQ(corpus_.size(), 1u);
  EXPECT_FALSE(corpus_.contains_document("doc2"));
}

TEST_F(IngestionPipelineTest, CommitRefusesDesynchronizedStructures) {
  index_.insert({{1, 0, 0, 0}});
  auto prepared = pipeline_->prepare("doc1", "text");
  EXPECT_THROW(pipeline_->commit(prepared, index_, corpus_), OutOfRangeError);
  EXPECT_FALSE(corpus_.contains_document("doc1"));
}

TEST_F(IngestionPipelineTest, IngestSavesAfterCommit) {
  MockStateStore state_store;
  EXPECT_CALL(state_store, save(_, _, "controlled"))
      .WillOnce(testing::Invoke(
          [](const VectorIndex& index, const CorpusStore& corpus, const std::string&) {
            EXPECT_EQ(index.size(), 3u);
            EXPECT_EQ(corpus.size(), 3u);
          }));

  auto prepared = pipeline_->ingest("doc1", "abcdefghijklmnopqrst", index_, corpus_, state_store);
  EXPECT_EQ(prepared.chunks.size(), 3u);
}

TEST_F(IngestionPipelineTest, IngestSaveFailureLeavesCommittedState) {
  MockStateStore state_store;
  EXPECT_CALL(state_store, save(_, _, _)).WillOnce(Throw(PersistenceError("disk full")));

  EXPECT_THROW(pipeline_->ingest("doc1", "text", index_, corpus_, state_store), PersistenceError);
  EXPECT_EQ(index_.size(), corpus_.size());
  EXPECT_TRUE(corpus_.contains_document("doc1"));
}

}  // namespace sage_core
