#include <geomark/registry/point_registry.hpp>

#include <geomark/datum/datum_registry.hpp>
#include <geomark/projection/utm_projection.hpp>
#include <geomark/types/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace
{
using namespace geomark;

void validateCoordinate(const GeographicCoordinate &coordinate)
{
    if (!std::isfinite(coordinate.latitude) || std::abs(coordinate.latitude) > 90.0)
    {
        throw OutOfRangeError("Latitude " + std::to_string(coordinate.latitude) + " outside [-90, 90]");
    }
    if (!std::isfinite(coordinate.longitude) || std::abs(coordinate.longitude) > 180.0)
    {
        throw OutOfRangeError("Longitude " + std::to_string(coordinate.longitude) + " outside [-180, 180]");
    }
}
// KML readers trim element text, so a name must survive trimming unchanged
void validateName(const std::string &name)
{
    if (name.empty())
    {
        throw std::invalid_argument("Point name must not be empty");
    }
    if (std::isspace(static_cast<unsigned char>(name.front())) || std::isspace(static_cast<unsigned char>(name.back())))
    {
        throw std::invalid_argument("Point name '" + name + "' must not start or end with whitespace");
    }
}
} // namespace

namespace geomark
{

std::vector<Point>::iterator PointRegistry::findPoint(const std::string &name)
{
    return std::find_if(_points.begin(), _points.end(), [&name](const Point &p) { return p.name == name; });
}

std::vector<Point>::const_iterator PointRegistry::findPoint(const std::string &name) const
{
    return std::find_if(_points.begin(), _points.end(), [&name](const Point &p) { return p.name == name; });
}

void PointRegistry::add(const Point &point)
{
    validateName(point.name);
    if (contains(point.name))
    {
        throw DuplicateNameError(point.name);
    }
    validateCoordinate(point.coordinate);

    _points.push_back(point);
    spdlog::debug("added point {} at {},{} ({})", point.name, point.coordinate.latitude, point.coordinate.longitude,
                  datumIdToString(point.coordinate.datum));
}

void PointRegistry::add(const std::string &name, const GeographicCoordinate &coordinate)
{
    Point p;
    p.name = name;
    p.coordinate = coordinate;
    add(p);
}

void PointRegistry::addFromUtm(const std::string &name, const UtmCoordinate &utm)
{
    add(name, toGeographic(utm));
}

void PointRegistry::rename(const std::string &old_name, const std::string &new_name)
{
    auto iter = findPoint(old_name);
    if (iter == _points.end())
    {
        throw NotFoundError(old_name);
    }
    if (new_name == old_name)
    {
        return;
    }
    validateName(new_name);
    if (contains(new_name))
    {
        throw DuplicateNameError(new_name);
    }
    iter->name = new_name;
    spdlog::debug("renamed point {} to {}", old_name, new_name);
}

void PointRegistry::move(const std::string &name, const GeographicCoordinate &coordinate)
{
    auto iter = findPoint(name);
    if (iter == _points.end())
    {
        throw NotFoundError(name);
    }
    validateCoordinate(coordinate);
    iter->coordinate = coordinate;
    spdlog::debug("moved point {} to {},{}", name, coordinate.latitude, coordinate.longitude);
}

void PointRegistry::moveFromUtm(const std::string &name, const UtmCoordinate &utm)
{
    if (!contains(name))
    {
        throw NotFoundError(name);
    }
    move(name, toGeographic(utm));
}

void PointRegistry::remove(const std::string &name)
{
    auto iter = findPoint(name);
    if (iter == _points.end())
    {
        throw NotFoundError(name);
    }
    _points.erase(iter);
    spdlog::debug("deleted point {}", name);
}

BulkImportReport PointRegistry::addBulk(const std::vector<bulk_entry> &entries, DatumId default_datum)
{
    BulkImportReport report;
    for (const auto &entry : entries)
    {
        try
        {
            UtmCoordinate utm;
            utm.zone = parseZoneTag(entry.zone_tag);
            utm.easting = entry.easting;
            utm.northing = entry.northing;
            utm.datum = entry.datum.empty() ? default_datum : resolveDatumId(entry.datum);
            addFromUtm(entry.name, utm);
            report.accepted.push_back(entry.name);
        }
        catch (const GeomarkError &e)
        {
            spdlog::warn("skipping point {} on line {}: {}", entry.name, entry.line_number, e.what());
            report.skipped.push_back({entry.line_number, entry.name, e.what()});
        }
        catch (const std::invalid_argument &e)
        {
            spdlog::warn("skipping entry on line {}: {}", entry.line_number, e.what());
            report.skipped.push_back({entry.line_number, entry.name, e.what()});
        }
    }

    spdlog::info("bulk import added {} points, skipped {}", report.accepted.size(), report.skipped.size());
    return report;
}

const Point &PointRegistry::get(const std::string &name) const
{
    auto iter = findPoint(name);
    if (iter == _points.end())
    {
        throw NotFoundError(name);
    }
    return *iter;
}

std::optional<Point> PointRegistry::find(const std::string &name) const
{
    auto iter = findPoint(name);
    if (iter == _points.end())
    {
        return std::nullopt;
    }
    return *iter;
}

bool PointRegistry::contains(const std::string &name) const
{
    return findPoint(name) != _points.end();
}

} // namespace geomark
