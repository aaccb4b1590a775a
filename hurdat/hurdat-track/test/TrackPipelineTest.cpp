// Ticket: 0004_track_pipeline

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "hurdat-track/src/TrackErrors.hpp"
#include "hurdat-track/src/TrackPipeline.hpp"
#include "hurdat-track/src/Transfer/TrackRecords.hpp"
#include "hurdat-track/test/Helpers/SampleTracks.hpp"

namespace hurdat_track::test
{

class TrackPipelineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    atlanticPath_ = writeTempFile("pipeline_atlantic.txt",
                                  atlantic1851() + singleObservationIda());
    pacificPath_ = writeTempFile("pipeline_pacific.txt", pacific1949());
    brokenPath_ = writeTempFile(
      "pipeline_broken.txt",
      "AL011851,            UNNAMED,      1,\n" +
        observationLine("18510625, 0000,  , QQ, 28.0N,  94.8W,  80, -999,"));
  }

  void TearDown() override
  {
    for (const auto& path : {atlanticPath_, pacificPath_, brokenPath_})
    {
      std::filesystem::remove(path);
    }
  }

  TrackPipeline makePipeline(bool stopOnError, bool parallel) const
  {
    TrackPipeline::Config config;
    config.stopOnError = stopOnError;
    config.parallel = parallel;
    return TrackPipeline{config, nullLogger()};
  }

  static std::vector<std::string> eventIds(const NormalizedTrack& track)
  {
    std::vector<std::string> ids;
    for (const auto& storm : track.storms)
    {
      ids.push_back(storm.eventId);
    }
    return ids;
  }

  std::filesystem::path atlanticPath_;
  std::filesystem::path pacificPath_;
  std::filesystem::path brokenPath_;
};

// ========== Single file ==========

TEST_F(TrackPipelineTest, ProcessFile_ExtractsAndNormalizes)
{
  const auto pipeline = makePipeline(true, false);
  const auto track = pipeline.processFile(atlanticPath_);

  EXPECT_EQ(eventIds(track),
            (std::vector<std::string>{"AL011851", "AL092023"}));
  EXPECT_EQ(track.observations.size(), 4u);
}

TEST_F(TrackPipelineTest, ProcessFile_MissingFile_Throws)
{
  const auto pipeline = makePipeline(true, false);
  EXPECT_THROW(pipeline.processFile("/nonexistent/hurdat2.txt"),
               std::runtime_error);
}

// ========== Several files ==========

TEST_F(TrackPipelineTest, ProcessFiles_ConcatenatesInInputOrder)
{
  const auto pipeline = makePipeline(true, false);
  const auto result = pipeline.processFiles({pacificPath_, atlanticPath_});

  EXPECT_TRUE(result.succeeded());
  EXPECT_EQ(eventIds(result.track),
            (std::vector<std::string>{
              "EP011949", "EP021949", "AL011851", "AL092023"}));
  EXPECT_EQ(result.track.observations.size(), 8u);
  EXPECT_EQ(result.track.observations.front().eventId, "EP011949");
  EXPECT_EQ(result.track.observations.back().eventId, "AL092023");
}

TEST_F(TrackPipelineTest, ProcessFiles_ParallelMatchesSequential)
{
  const std::vector<std::filesystem::path> paths{atlanticPath_, pacificPath_};
  const auto sequential = makePipeline(true, false).processFiles(paths);
  const auto parallel = makePipeline(true, true).processFiles(paths);

  EXPECT_EQ(eventIds(sequential.track), eventIds(parallel.track));

  const auto a = toRecords(sequential.track);
  const auto b = toRecords(parallel.track);
  ASSERT_EQ(a.observations.size(), b.observations.size());
  for (std::size_t i = 0; i < a.storms.size(); ++i)
  {
    EXPECT_EQ(a.storms[i].path, b.storms[i].path);
  }
  for (std::size_t i = 0; i < a.observations.size(); ++i)
  {
    EXPECT_EQ(a.observations[i].point_time, b.observations[i].point_time);
    EXPECT_EQ(a.observations[i].storm.id, b.observations[i].storm.id);
  }
}

TEST_F(TrackPipelineTest, ProcessFiles_StopOnError_Rethrows)
{
  const auto pipeline = makePipeline(true, false);
  EXPECT_THROW(pipeline.processFiles({atlanticPath_, brokenPath_}),
               UnknownCodeError);
}

TEST_F(TrackPipelineTest, ProcessFiles_ParallelStopOnError_Rethrows)
{
  const auto pipeline = makePipeline(true, true);
  EXPECT_THROW(
    pipeline.processFiles({brokenPath_, atlanticPath_, pacificPath_}),
    UnknownCodeError);
}

TEST_F(TrackPipelineTest, ProcessFiles_ContinueOnError_SkipsFailedFile)
{
  const auto pipeline = makePipeline(false, false);
  const auto result =
    pipeline.processFiles({pacificPath_, brokenPath_, atlanticPath_});

  EXPECT_FALSE(result.succeeded());
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].path, brokenPath_);
  EXPECT_NE(result.failures[0].message.find("QQ"), std::string::npos);
  EXPECT_EQ(eventIds(result.track),
            (std::vector<std::string>{
              "EP011949", "EP021949", "AL011851", "AL092023"}));
}

TEST_F(TrackPipelineTest, ProcessFiles_ContinueOnError_MissingFile)
{
  const auto pipeline = makePipeline(false, true);
  const auto result =
    pipeline.processFiles({"/nonexistent/hurdat2.txt", pacificPath_});

  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.track.storms.size(), 2u);
}

TEST_F(TrackPipelineTest, ProcessFiles_DuplicateEventIdAcrossFiles)
{
  const auto pipeline = makePipeline(true, false);
  EXPECT_THROW(pipeline.processFiles({pacificPath_, pacificPath_}),
               MalformedRecordError);

  const auto lenient = makePipeline(false, false);
  const auto result = lenient.processFiles({pacificPath_, pacificPath_});
  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.track.storms.size(), 2u);
}

TEST_F(TrackPipelineTest, Run_UsesConfiguredPathsAndIsRepeatable)
{
  TrackPipeline::Config config;
  config.sourcePaths = {atlanticPath_, pacificPath_};
  const TrackPipeline pipeline{config, nullLogger()};

  const auto first = pipeline.run();
  const auto second = pipeline.run();

  EXPECT_EQ(first.track.storms.size(), 4u);
  EXPECT_EQ(eventIds(first.track), eventIds(second.track));
  EXPECT_EQ(first.track.observations.size(),
            second.track.observations.size());
}

TEST_F(TrackPipelineTest, ProcessFiles_NoFilesYieldsEmptyResult)
{
  const auto result = makePipeline(true, false).processFiles({});
  EXPECT_TRUE(result.succeeded());
  EXPECT_TRUE(result.track.storms.empty());
}

TEST_F(TrackPipelineTest, BuildLogger_ReusesRegisteredLogger)
{
  auto first = buildLogger("hurdat_pipeline_test", spdlog::level::warn);
  auto second = buildLogger("hurdat_pipeline_test", spdlog::level::debug);

  EXPECT_EQ(first, second);
  EXPECT_EQ(second->level(), spdlog::level::debug);
  spdlog::drop("hurdat_pipeline_test");
}

}  // namespace hurdat_track::test
