#pragma once

#include <geomark/types/datum.hpp>

#include <string>

namespace geomark
{

struct Settings
{
    DatumId default_datum = DatumId::WGS84;
    std::string document_name = "Untitled"; // name given to documents created without one
    int compression_level = 6;
    int coordinate_precision = 10;
};

// keys missing from the file keep their current value in settings
bool loadSettings(const std::string &path, Settings &settings);
bool saveSettings(const Settings &settings, const std::string &path);

} // namespace geomark
