#pragma once

#include <geomark/types/geographic_coordinate.hpp>
#include <geomark/types/utm_coordinate.hpp>

#include <optional>
#include <string>

namespace geomark
{

constexpr double UTM_SCALE_FACTOR = 0.9996;
constexpr double UTM_FALSE_EASTING = 500000.0;
constexpr double UTM_FALSE_NORTHING_SOUTH = 10000000.0;
constexpr double UTM_MAX_LATITUDE = 84.0;
// |E - 500000| beyond this leaves the region where the series is accurate
constexpr double UTM_MAX_EASTING_OFFSET = 2000000.0;
constexpr double UTM_INVERSE_TOLERANCE = 0.01;

// zone_override projects into that zone even when the point lies outside it
UtmCoordinate toUtm(const GeographicCoordinate &coordinate, std::optional<int> zone_override = std::nullopt);

// rejects eastings and northings the series cannot invert
GeographicCoordinate toGeographic(const UtmCoordinate &utm);

int naturalZone(double longitude);
double centralMeridian(int zone);
char latitudeBand(double latitude);
Hemisphere hemisphereOfBand(char band);

// "30T", "33N" -> zone number and band letter, throws InvalidZoneError
UtmZone parseZoneTag(const std::string &tag);
std::string zoneTag(const UtmZone &zone);

} // namespace geomark
