// Ticket: 0002_track_normalization

#include "hurdat-track/src/DataTypes/TrackGeometry.hpp"

#include <format>
#include <stdexcept>

namespace hurdat_track
{

namespace
{

constexpr const char* kNullToken = "NULL";

std::string optionalToken(const std::optional<int>& value)
{
  return value ? std::to_string(*value) : kNullToken;
}

// Overload set for std::visit
template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};

}  // namespace

std::string TrackVertex::toToken() const
{
  return std::format("{} {} {} {}",
                     formatDegrees(position.longitude()),
                     formatDegrees(position.latitude()),
                     optionalToken(maxWindKnots),
                     optionalToken(minPressureMb));
}

TrackGeometry makeTrackGeometry(std::vector<TrackVertex> vertices)
{
  if (vertices.empty())
  {
    throw std::invalid_argument{"Storm geometry requires at least one vertex"};
  }
  if (vertices.size() == 1)
  {
    return TrackPoint{vertices.front()};
  }
  return TrackPath{std::move(vertices)};
}

std::size_t vertexCount(const TrackGeometry& geometry)
{
  return std::visit(
    Overloaded{[](const TrackPoint&) -> std::size_t { return 1; },
               [](const TrackPath& path) { return path.vertices.size(); }},
    geometry);
}

std::string toWkt(const TrackGeometry& geometry)
{
  return std::visit(
    Overloaded{
      [](const TrackPoint& point)
      { return std::format("POINT({})", point.vertex.toToken()); },
      [](const TrackPath& path)
      {
        std::string wkt = "LINESTRING(";
        for (std::size_t i = 0; i < path.vertices.size(); ++i)
        {
          if (i > 0)
          {
            wkt += ",";
          }
          wkt += path.vertices[i].toToken();
        }
        wkt += ')';
        return wkt;
      }},
    geometry);
}

}  // namespace hurdat_track
