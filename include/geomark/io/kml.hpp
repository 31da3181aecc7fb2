#pragma once

#include <geomark/registry/point_registry.hpp>
#include <geomark/types/document.hpp>

#include <string>
#include <vector>

namespace geomark
{

struct kml_options
{
    int coordinate_precision = 10; // decimals written for longitude and latitude
};

struct ReadReport
{
    std::vector<std::string> accepted;
    std::vector<skipped_entry> skipped;
    std::vector<std::string> defaulted; // "<placemark>: <what was defaulted>"
};

struct DeserializeResult
{
    Document document;
    ReadReport report;
};

std::string toKml(const Document &document, const kml_options &options = kml_options());

// throws MalformedMarkupError, unusable placemarks are skipped and reported
DeserializeResult fromKml(const std::string &markup);

} // namespace geomark
