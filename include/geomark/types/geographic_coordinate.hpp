#pragma once

#include <geomark/types/datum.hpp>

namespace geomark
{

struct GeographicCoordinate
{
    double latitude = 0;  // degrees, [-90, 90]
    double longitude = 0; // degrees, [-180, 180]
    DatumId datum = DatumId::WGS84;

    bool operator==(const GeographicCoordinate &other) const
    {
        return latitude == other.latitude && longitude == other.longitude && datum == other.datum;
    }

    bool operator!=(const GeographicCoordinate &other) const
    {
        return !(*this == other);
    }
};

} // namespace geomark
