// Ticket: 0001_hurdat2_record_extraction

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "hurdat-track/src/Extraction/RecordExtractor.hpp"
#include "hurdat-track/src/TrackErrors.hpp"
#include "hurdat-track/test/Helpers/SampleTracks.hpp"

namespace hurdat_track::test
{

class RecordExtractorTest : public ::testing::Test
{
protected:
  ExtractedTrack extract(const std::string& text) const
  {
    std::istringstream input{text};
    return extractor_.extract(input, "sample.txt");
  }

  RecordExtractor extractor_{nullLogger()};
};

// ========== Headers ==========

TEST_F(RecordExtractorTest, Extract_HeaderFieldsAreSliced)
{
  const auto track = extract(singleObservationIda());

  ASSERT_EQ(track.headers.size(), 1u);
  const auto& header = track.headers[0];
  EXPECT_EQ(header.eventId, "AL092023");
  EXPECT_EQ(header.basin, "AL");
  EXPECT_EQ(header.stormNumber, "09");
  EXPECT_EQ(header.year, "2023");
  EXPECT_EQ(header.name, "IDA");
  EXPECT_EQ(header.declaredPointCount, 39);
  EXPECT_EQ(header.lineNumber, 1u);
  EXPECT_EQ(track.source, "sample.txt");
}

TEST_F(RecordExtractorTest, Extract_CountMismatchIsNotFatal)
{
  const auto track = extract(singleObservationIda());
  EXPECT_EQ(track.observations.size(), 1u);
}

TEST_F(RecordExtractorTest, Extract_ObservationsFollowTheirHeader)
{
  const auto track = extract(pacific1949());

  ASSERT_EQ(track.headers.size(), 2u);
  ASSERT_EQ(track.observations.size(), 4u);
  EXPECT_EQ(track.observations[0].eventId, "EP011949");
  EXPECT_EQ(track.observations[1].headerIndex, 0u);
  EXPECT_EQ(track.observations[2].eventId, "EP021949");
  EXPECT_EQ(track.observations[3].headerIndex, 1u);
  EXPECT_EQ(track.observations[3].lineNumber, 6u);
}

// ========== Observation fields ==========

TEST_F(RecordExtractorTest, Extract_ObservationFieldsAreSliced)
{
  const auto track = extract(singleObservationIda());

  ASSERT_EQ(track.observations.size(), 1u);
  const auto& obs = track.observations[0];
  EXPECT_EQ(obs.year, "2023");
  EXPECT_EQ(obs.month, "08");
  EXPECT_EQ(obs.day, "29");
  EXPECT_EQ(obs.hour, "16");
  EXPECT_EQ(obs.minute, "55");
  EXPECT_EQ(obs.identifierCode, "L");
  EXPECT_EQ(obs.statusCode, "HU");
  EXPECT_DOUBLE_EQ(obs.latitude, 29.1);
  EXPECT_DOUBLE_EQ(obs.longitude, -90.2);
  EXPECT_EQ(obs.maxWindKnots, 130);
  EXPECT_EQ(obs.minPressureMb, 931);
  EXPECT_EQ(obs.windRadiiNm[0], 130);
  EXPECT_EQ(obs.windRadiiNm[3], 110);
  EXPECT_EQ(obs.windRadiiNm[11], 30);
}

TEST_F(RecordExtractorTest, Extract_SentinelsArePassedThrough)
{
  const auto track = extract(atlantic1851());

  ASSERT_EQ(track.observations.size(), 3u);
  EXPECT_EQ(track.observations[0].identifierCode, " ");
  EXPECT_EQ(track.observations[0].minPressureMb, -999);
  EXPECT_EQ(track.observations[2].maxWindKnots, -99);
  for (int radius : track.observations[1].windRadiiNm)
  {
    EXPECT_EQ(radius, -999);
  }
}

TEST_F(RecordExtractorTest, Extract_SouthernAndEasternHemispheres)
{
  const auto track = extract(pacific1949());

  const auto& obs = track.observations[2];
  EXPECT_DOUBLE_EQ(obs.latitude, 0.0);
  EXPECT_TRUE(std::signbit(obs.latitude));
  EXPECT_DOUBLE_EQ(obs.longitude, 179.9);
  EXPECT_DOUBLE_EQ(track.observations[3].latitude, -0.5);
  EXPECT_EQ(obs.statusCode, "ET");
}

TEST_F(RecordExtractorTest, Extract_ToleratesBlankLinesAndCarriageReturns)
{
  const std::string text = "\r\nAL092023,                IDA,     39,\r\n\n"
                           "20230829, 1655, L, HU, 29.1N,  90.2W, 130,  931,"
                           "  130,  110,   80,  110,   70,   60,   40,   60,"
                           "   45,   35,   20,   30,\r\n   \n";

  const auto track = extract(text);
  ASSERT_EQ(track.headers.size(), 1u);
  ASSERT_EQ(track.observations.size(), 1u);
  EXPECT_EQ(track.headers[0].lineNumber, 2u);
  EXPECT_EQ(track.observations[0].lineNumber, 4u);
}

TEST_F(RecordExtractorTest, Extract_EmptyInputYieldsEmptyTrack)
{
  const auto track = extract("");
  EXPECT_TRUE(track.headers.empty());
  EXPECT_TRUE(track.observations.empty());
}

// ========== Malformed input ==========

TEST_F(RecordExtractorTest, Extract_ObservationBeforeHeader_Throws)
{
  const std::string text =
    observationLine("18510625, 0000,  , HU, 28.0N,  94.8W,  80, -999,");
  EXPECT_THROW(extract(text), MalformedRecordError);
}

TEST_F(RecordExtractorTest, Extract_ShortObservation_ReportsLine)
{
  const std::string text = "AL011851,            UNNAMED,      1,\n"
                           "18510625, 0000,  , HU, 28.0N,  94.8W,  80,\n";
  try
  {
    extract(text);
    FAIL() << "Expected MalformedRecordError";
  }
  catch (const MalformedRecordError& e)
  {
    EXPECT_EQ(e.lineNumber(), 2u);
    EXPECT_NE(std::string{e.what()}.find("sample.txt:2:"), std::string::npos);
  }
}

TEST_F(RecordExtractorTest, Extract_NonNumericWind_Throws)
{
  const std::string text =
    "AL011851,            UNNAMED,      1,\n" +
    observationLine("18510625, 0000,  , HU, 28.0N,  94.8W,  8O, -999,");
  EXPECT_THROW(extract(text), MalformedRecordError);
}

TEST_F(RecordExtractorTest, Extract_BadHemisphere_Throws)
{
  const std::string text =
    "AL011851,            UNNAMED,      1,\n" +
    observationLine("18510625, 0000,  , HU, 28.0X,  94.8W,  80, -999,");
  EXPECT_THROW(extract(text), MalformedRecordError);
}

TEST_F(RecordExtractorTest, Extract_SignedOrNonFiniteMagnitude_Throws)
{
  const std::string header = "AL011851,            UNNAMED,      1,\n";
  for (const char* position : {"-5.0S,  94.8W",
                               "-5.0N,  94.8W",
                               "+5.0N,  94.8W",
                               "nanN,  94.8W",
                               "infN,  94.8W",
                               "28.0N,  -94.8W",
                               "28.0N,  infW",
                               "28.0N,  1.2.3W",
                               "28.0N,  .W"})
  {
    const std::string text =
      header + observationLine(std::string{"18510625, 0000,  , HU, "} +
                               position + ",  80, -999,");
    EXPECT_THROW(extract(text), MalformedRecordError) << position;
  }
}

TEST_F(RecordExtractorTest, Extract_HemisphereRoundTrips)
{
  const std::string text =
    "AL011851,            UNNAMED,      2,\n" +
    observationLine("18510625, 0000,  , HU,  5.0S,   0.0W,  80, -999,") +
    "\n" +
    observationLine("18510625, 0600,  , HU,  5.0N,  10.0E,  80, -999,");

  const auto track = extract(text);
  ASSERT_EQ(track.observations.size(), 2u);
  EXPECT_TRUE(std::signbit(track.observations[0].latitude));
  EXPECT_TRUE(std::signbit(track.observations[0].longitude));
  EXPECT_FALSE(std::signbit(track.observations[1].latitude));
  EXPECT_FALSE(std::signbit(track.observations[1].longitude));
}

TEST_F(RecordExtractorTest, Extract_HeaderWithoutObservations_Throws)
{
  const std::string text = "AL011851,            UNNAMED,      1,\n" +
                           singleObservationIda();
  EXPECT_THROW(extract(text), MalformedRecordError);
}

TEST_F(RecordExtractorTest, Extract_TrailingHeaderWithoutObservations_Throws)
{
  const std::string text =
    singleObservationIda() + "AL011851,            UNNAMED,      1,\n";
  EXPECT_THROW(extract(text), MalformedRecordError);
}

TEST_F(RecordExtractorTest, Extract_DuplicateEventId_Throws)
{
  EXPECT_THROW(extract(singleObservationIda() + singleObservationIda()),
               MalformedRecordError);
}

TEST_F(RecordExtractorTest, Extract_InvalidEventId_Throws)
{
  EXPECT_THROW(extract("AL0923,                IDA,     1,\n"),
               MalformedRecordError);
  EXPECT_THROW(extract("ALxx2023,                IDA,     1,\n"),
               MalformedRecordError);
}

TEST_F(RecordExtractorTest, Extract_NonPositiveDeclaredCount_Throws)
{
  EXPECT_THROW(extract("AL092023,                IDA,      0,\n"),
               MalformedRecordError);
  EXPECT_THROW(extract("AL092023,                IDA,    abc,\n"),
               MalformedRecordError);
}

// ========== Files ==========

TEST_F(RecordExtractorTest, ExtractFile_ReadsFromDisk)
{
  const auto path =
    writeTempFile("record_extractor_test.txt", atlantic1851());

  const auto track = extractor_.extractFile(path);
  EXPECT_EQ(track.headers.size(), 1u);
  EXPECT_EQ(track.observations.size(), 3u);
  EXPECT_EQ(track.source, path.string());

  std::filesystem::remove(path);
}

TEST_F(RecordExtractorTest, ExtractFile_MissingFile_Throws)
{
  EXPECT_THROW(extractor_.extractFile("/nonexistent/hurdat2.txt"),
               std::runtime_error);
}

}  // namespace hurdat_track::test
