#pragma once

#include <geomark/types/point.hpp>
#include <geomark/types/utm_coordinate.hpp>

#include <optional>
#include <string>
#include <vector>

namespace geomark
{

// one line of a point list file, fields still unresolved
struct bulk_entry
{
    size_t line_number = 0;
    std::string name;
    double easting = 0;
    double northing = 0;
    std::string zone_tag;
    std::string datum; // empty selects the import default
};

struct skipped_entry
{
    size_t line_number = 0; // 0 when not read from a file
    std::string name;
    std::string reason;
};

struct BulkImportReport
{
    std::vector<std::string> accepted;
    std::vector<skipped_entry> skipped;
};

// single point operations leave the registry unchanged when they throw
class PointRegistry
{
  public:
    void add(const Point &point);
    void add(const std::string &name, const GeographicCoordinate &coordinate);
    void addFromUtm(const std::string &name, const UtmCoordinate &utm);

    void rename(const std::string &old_name, const std::string &new_name);
    void move(const std::string &name, const GeographicCoordinate &coordinate);
    void moveFromUtm(const std::string &name, const UtmCoordinate &utm);
    void remove(const std::string &name);

    // processes every entry independently, failures are collected rather than thrown
    BulkImportReport addBulk(const std::vector<bulk_entry> &entries, DatumId default_datum = DatumId::WGS84);

    const std::vector<Point> &list() const
    {
        return _points;
    }

    const Point &get(const std::string &name) const;
    std::optional<Point> find(const std::string &name) const;
    bool contains(const std::string &name) const;

    size_t size() const
    {
        return _points.size();
    }

    bool empty() const
    {
        return _points.empty();
    }

    void clear()
    {
        _points.clear();
    }

    auto begin() const
    {
        return _points.cbegin();
    }
    auto end() const
    {
        return _points.cend();
    }

  private:
    std::vector<Point>::iterator findPoint(const std::string &name);
    std::vector<Point>::const_iterator findPoint(const std::string &name) const;

    std::vector<Point> _points;
};

} // namespace geomark
