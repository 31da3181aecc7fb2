#pragma once

#include <geomark/types/geographic_coordinate.hpp>

#include <optional>
#include <string>

namespace geomark
{

struct Point
{
    std::string name;
    GeographicCoordinate coordinate;

    std::optional<double> altitude;
    std::optional<std::string> style_url;
    std::optional<std::string> description;

    bool operator==(const Point &other) const
    {
        return name == other.name && coordinate == other.coordinate && altitude == other.altitude &&
               style_url == other.style_url && description == other.description;
    }
};

} // namespace geomark
