#pragma once

#include <geomark/registry/point_registry.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace geomark
{

struct point_list
{
    std::vector<bulk_entry> entries;
    std::vector<skipped_entry> rejected_lines;
};

// "name easting northing zone [datum]" per line, '#' starts a comment
point_list parsePointList(std::istream &in);

// parse and add, the report holds both rejected lines and entries skipped by the registry
BulkImportReport importPointList(std::istream &in, PointRegistry &registry, DatumId default_datum);
BulkImportReport importPointList(const std::string &path, PointRegistry &registry, DatumId default_datum);

} // namespace geomark
