// Ticket: 0002_track_normalization

#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>
#include <vector>

#include "hurdat-track/src/DataTypes/TrackGeometry.hpp"

using namespace hurdat_track;

namespace
{

TrackVertex vertex(double lon, double lat,
                   std::optional<int> wind, std::optional<int> pressure)
{
  return TrackVertex{GeoCoordinate{lon, lat}, wind, pressure};
}

}  // namespace

TEST(TrackGeometryTest, ToToken_NullForMissingIntensity)
{
  EXPECT_EQ(vertex(-94.8, 28.0, 80, std::nullopt).toToken(),
            "-94.8 28.0 80 NULL");
  EXPECT_EQ(vertex(-90.2, 29.1, 130, 931).toToken(), "-90.2 29.1 130 931");
  EXPECT_EQ(vertex(-96.0, 28.0, std::nullopt, std::nullopt).toToken(),
            "-96.0 28.0 NULL NULL");
}

TEST(TrackGeometryTest, MakeTrackGeometry_SingleVertexIsPoint)
{
  const auto geometry =
    makeTrackGeometry({vertex(-90.2, 29.1, 130, 931)});

  ASSERT_TRUE(std::holds_alternative<TrackPoint>(geometry));
  EXPECT_EQ(vertexCount(geometry), 1u);
  EXPECT_EQ(toWkt(geometry), "POINT(-90.2 29.1 130 931)");
}

TEST(TrackGeometryTest, MakeTrackGeometry_SeveralVerticesArePathInOrder)
{
  const auto geometry = makeTrackGeometry(
    {vertex(-94.8, 28.0, 80, std::nullopt),
     vertex(-95.4, 28.0, 80, std::nullopt),
     vertex(-96.0, 28.0, std::nullopt, std::nullopt)});

  ASSERT_TRUE(std::holds_alternative<TrackPath>(geometry));
  EXPECT_EQ(vertexCount(geometry), 3u);
  EXPECT_EQ(toWkt(geometry),
            "LINESTRING(-94.8 28.0 80 NULL,-95.4 28.0 80 NULL,"
            "-96.0 28.0 NULL NULL)");
}

TEST(TrackGeometryTest, MakeTrackGeometry_RepeatedPositionStaysPath)
{
  const auto geometry = makeTrackGeometry(
    {vertex(-94.8, 28.0, 80, 990), vertex(-94.8, 28.0, 85, 985)});

  ASSERT_TRUE(std::holds_alternative<TrackPath>(geometry));
  EXPECT_EQ(vertexCount(geometry), 2u);
}

TEST(TrackGeometryTest, MakeTrackGeometry_Empty_Throws)
{
  EXPECT_THROW(makeTrackGeometry({}), std::invalid_argument);
}
