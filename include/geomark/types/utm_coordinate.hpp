#pragma once

#include <geomark/types/datum.hpp>

#include <optional>

namespace geomark
{

enum class Hemisphere
{
    NORTH,
    SOUTH
};

struct UtmZone
{
    int number = 0;
    Hemisphere hemisphere = Hemisphere::NORTH;
    std::optional<char> band; // latitude band letter C..X when known
};

struct UtmCoordinate
{
    UtmZone zone;
    double easting = 0;
    double northing = 0;
    DatumId datum = DatumId::WGS84;
};

} // namespace geomark
