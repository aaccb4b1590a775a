// Ticket: 0002_track_normalization
// Longitude/latitude pair backed by Eigen

#ifndef HURDAT_TRACK_GEO_COORDINATE_HPP
#define HURDAT_TRACK_GEO_COORDINATE_HPP

#include <cmath>
#include <format>
#include <string>

#include <Eigen/Dense>

namespace hurdat_track
{

/**
 * @brief Shortest round-trip decimal text, keeping one decimal place for
 * whole numbers: 28.0 -> "28.0", -94.8 -> "-94.8", -0.0 -> "-0.0"
 */
inline std::string formatDegrees(double degrees)
{
  if (std::isfinite(degrees) && std::trunc(degrees) == degrees)
  {
    return std::format("{:.1f}", degrees);
  }
  return std::format("{}", degrees);
}

/**
 * @brief Signed decimal-degree position on the WGS84 ellipsoid
 *
 * Stored as an Eigen::Vector2d in (x, y) = (longitude, latitude) order, which
 * is also the WKT axis order. South latitudes and west longitudes are
 * negative. The hemisphere is recovered from the sign bit, so a source value
 * of "0.0S" survives as -0.0 and still reports 'S'.
 */
struct GeoCoordinate final : Eigen::Vector2d
{
  static constexpr Eigen::Index Longitude = 0;
  static constexpr Eigen::Index Latitude = 1;

  GeoCoordinate() : Eigen::Vector2d{0.0, 0.0}
  {
  }

  GeoCoordinate(double longitude, double latitude)
    : Eigen::Vector2d{longitude, latitude}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  GeoCoordinate(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector2d{other}
  {
  }

  template <typename OtherDerived>
  GeoCoordinate& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector2d::operator=(other);
    return *this;
  }

  double longitude() const
  {
    return (*this)[Longitude];
  }

  double latitude() const
  {
    return (*this)[Latitude];
  }

  char latitudeHemisphere() const
  {
    return std::signbit(latitude()) ? 'S' : 'N';
  }

  char longitudeHemisphere() const
  {
    return std::signbit(longitude()) ? 'W' : 'E';
  }

  /// WKT "POINT(lon lat)", numbers as formatDegrees() writes them.
  std::string toWkt() const
  {
    return std::format(
      "POINT({} {})", formatDegrees(longitude()), formatDegrees(latitude()));
  }

  // Rule of Zero
  GeoCoordinate(const GeoCoordinate&) = default;
  GeoCoordinate(GeoCoordinate&&) noexcept = default;
  GeoCoordinate& operator=(const GeoCoordinate&) = default;
  GeoCoordinate& operator=(GeoCoordinate&&) noexcept = default;
  ~GeoCoordinate() = default;
};

}  // namespace hurdat_track

/**
 * Formats as the HURDAT2 source writes positions, e.g. "28.0N 94.8W".
 * An optional precision overrides the default of one decimal place:
 * "{:.2}" gives "28.00N 94.80W".
 */
template <>
struct std::formatter<hurdat_track::GeoCoordinate>
{
  int precision = 1;

  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    return it;
  }

  auto format(const hurdat_track::GeoCoordinate& coord,
              std::format_context& ctx) const
  {
    return std::format_to(ctx.out(),
                          "{:.{}f}{} {:.{}f}{}",
                          std::abs(coord.latitude()),
                          precision,
                          coord.latitudeHemisphere(),
                          std::abs(coord.longitude()),
                          precision,
                          coord.longitudeHemisphere());
  }
};

#endif  // HURDAT_TRACK_GEO_COORDINATE_HPP
