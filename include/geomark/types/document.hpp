#pragma once

#include <geomark/registry/point_registry.hpp>

#include <string>

namespace geomark
{

struct Document
{
    std::string name = "Untitled";
    PointRegistry points;
};

} // namespace geomark
