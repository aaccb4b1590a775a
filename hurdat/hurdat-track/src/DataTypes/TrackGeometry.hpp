// Ticket: 0002_track_normalization

#ifndef HURDAT_TRACK_TRACK_GEOMETRY_HPP
#define HURDAT_TRACK_TRACK_GEOMETRY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "hurdat-track/src/DataTypes/GeoCoordinate.hpp"

namespace hurdat_track
{

/**
 * @brief One vertex of a storm path
 *
 * Intensity rides along with the position so the rendered path keeps one
 * "lon lat wind pressure" token per observation. Missing intensity is kept
 * as an explicit null rather than dropped.
 */
struct TrackVertex
{
  GeoCoordinate position;
  std::optional<int> maxWindKnots;
  std::optional<int> minPressureMb;

  /// "lon lat wind pressure", with NULL standing in for missing values.
  std::string toToken() const;
};

/// Geometry of a storm observed exactly once.
struct TrackPoint
{
  TrackVertex vertex;
};

/// Connected line through two or more observations in chronological order.
struct TrackPath
{
  std::vector<TrackVertex> vertices;
};

using TrackGeometry = std::variant<TrackPoint, TrackPath>;

/**
 * @brief Build the geometry for a storm from its ordered vertices
 *
 * One vertex yields a TrackPoint, more yield a TrackPath in the given order.
 *
 * @throws std::invalid_argument if vertices is empty
 */
TrackGeometry makeTrackGeometry(std::vector<TrackVertex> vertices);

std::size_t vertexCount(const TrackGeometry& geometry);

/// WKT: "POINT(tok)" or "LINESTRING(tok,tok,...)".
std::string toWkt(const TrackGeometry& geometry);

}  // namespace hurdat_track

#endif  // HURDAT_TRACK_TRACK_GEOMETRY_HPP
