#pragma once

#include <geomark/types/point.hpp>

#include <string>
#include <vector>

namespace geomark
{

// meters on b's ellipsoid, a is reprojected onto b's datum first
double distance(const Point &a, const Point &b);
double distance(const GeographicCoordinate &a, const GeographicCoordinate &b);

// straight line distance after projecting both points into a's natural UTM zone
double planarDistance(const Point &a, const Point &b);

struct point_pair_distance
{
    std::string from;
    std::string to;
    double meters;
};

// every unordered pair, with all coordinates measured on the given datum
std::vector<point_pair_distance> distancesAll(const std::vector<Point> &points, DatumId datum);

// consecutive pairs in the given order
std::vector<point_pair_distance> distancesLine(const std::vector<Point> &points, DatumId datum);

double totalDistance(const std::vector<point_pair_distance> &distances);

} // namespace geomark
