#include <geomark/distance/distance.hpp>

#include <geomark/datum/datum_registry.hpp>
#include <geomark/projection/datum_shift.hpp>
#include <geomark/projection/utm_projection.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace
{
using namespace geomark;

constexpr double DEG2RAD = M_PI / 180.0;

double greatCircle(const GeographicCoordinate &a, const GeographicCoordinate &b, const Datum &d)
{
    // mean radius R1 = (2a + b) / 3
    const double radius = (2.0 * d.semi_major_axis + d.semiMinorAxis()) / 3.0;
    const double phi1 = a.latitude * DEG2RAD, phi2 = b.latitude * DEG2RAD;
    const double dphi = phi2 - phi1;
    const double dlambda = (b.longitude - a.longitude) * DEG2RAD;
    const double h = std::sin(dphi / 2) * std::sin(dphi / 2) +
                     std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2) * std::sin(dlambda / 2);
    return 2.0 * radius * std::asin(std::min(1.0, std::sqrt(h)));
}

// Vincenty's inverse formula, falls back to the great circle for nearly antipodal points
double vincenty(const GeographicCoordinate &a, const GeographicCoordinate &b, const Datum &d)
{
    const double f = d.flattening();
    const double semi_minor = d.semiMinorAxis();
    const double L = (b.longitude - a.longitude) * DEG2RAD;
    const double U1 = std::atan((1 - f) * std::tan(a.latitude * DEG2RAD));
    const double U2 = std::atan((1 - f) * std::tan(b.latitude * DEG2RAD));
    const double sinU1 = std::sin(U1), cosU1 = std::cos(U1);
    const double sinU2 = std::sin(U2), cosU2 = std::cos(U2);

    double lambda = L;
    double sin_sigma = 0, cos_sigma = 0, sigma = 0, cos2_alpha = 0, cos_2sigma_m = 0;
    bool converged = false;
    for (int i = 0; i < 200; i++)
    {
        const double sin_lambda = std::sin(lambda), cos_lambda = std::cos(lambda);
        sin_sigma = std::sqrt((cosU2 * sin_lambda) * (cosU2 * sin_lambda) +
                              (cosU1 * sinU2 - sinU1 * cosU2 * cos_lambda) * (cosU1 * sinU2 - sinU1 * cosU2 * cos_lambda));
        if (sin_sigma == 0)
        {
            return 0; // coincident points
        }
        cos_sigma = sinU1 * sinU2 + cosU1 * cosU2 * cos_lambda;
        sigma = std::atan2(sin_sigma, cos_sigma);
        const double sin_alpha = cosU1 * cosU2 * sin_lambda / sin_sigma;
        cos2_alpha = 1 - sin_alpha * sin_alpha;
        cos_2sigma_m = cos2_alpha != 0 ? cos_sigma - 2 * sinU1 * sinU2 / cos2_alpha : 0; // equatorial line
        const double C = f / 16 * cos2_alpha * (4 + f * (4 - 3 * cos2_alpha));
        const double previous = lambda;
        lambda = L + (1 - C) * f * sin_alpha *
                         (sigma + C * sin_sigma * (cos_2sigma_m + C * cos_sigma * (-1 + 2 * cos_2sigma_m * cos_2sigma_m)));
        if (std::abs(lambda - previous) < 1e-12)
        {
            converged = true;
            break;
        }
    }

    if (!converged)
    {
        spdlog::warn("geodesic between {},{} and {},{} did not converge, using great circle estimate", a.latitude,
                     a.longitude, b.latitude, b.longitude);
        return greatCircle(a, b, d);
    }

    const double a2 = d.semi_major_axis * d.semi_major_axis;
    const double b2 = semi_minor * semi_minor;
    const double u2 = cos2_alpha * (a2 - b2) / b2;
    const double A = 1 + u2 / 16384 * (4096 + u2 * (-768 + u2 * (320 - 175 * u2)));
    const double B = u2 / 1024 * (256 + u2 * (-128 + u2 * (74 - 47 * u2)));
    const double delta_sigma =
        B * sin_sigma *
        (cos_2sigma_m + B / 4 *
                            (cos_sigma * (-1 + 2 * cos_2sigma_m * cos_2sigma_m) -
                             B / 6 * cos_2sigma_m * (-3 + 4 * sin_sigma * sin_sigma) *
                                 (-3 + 4 * cos_2sigma_m * cos_2sigma_m)));

    return semi_minor * A * (sigma - delta_sigma);
}

} // namespace

namespace geomark
{

double distance(const GeographicCoordinate &a, const GeographicCoordinate &b)
{
    const GeographicCoordinate a_shifted = reproject(a, b.datum);
    if (a_shifted.latitude == b.latitude && a_shifted.longitude == b.longitude)
    {
        return 0;
    }
    return vincenty(a_shifted, b, datum(b.datum));
}

double distance(const Point &a, const Point &b)
{
    const double meters = distance(a.coordinate, b.coordinate);
    spdlog::debug("distance {} -> {}: {} m", a.name, b.name, meters);
    return meters;
}

double planarDistance(const Point &a, const Point &b)
{
    const UtmCoordinate ua = toUtm(a.coordinate);
    const UtmCoordinate ub = toUtm(reproject(b.coordinate, a.coordinate.datum), ua.zone.number);

    double dn = ub.northing - ua.northing;
    // bring both into the same false northing frame
    if (ua.zone.hemisphere != ub.zone.hemisphere)
    {
        dn += ua.zone.hemisphere == Hemisphere::SOUTH ? UTM_FALSE_NORTHING_SOUTH : -UTM_FALSE_NORTHING_SOUTH;
    }
    return std::hypot(ub.easting - ua.easting, dn);
}

std::vector<point_pair_distance> distancesAll(const std::vector<Point> &points, DatumId datum_id)
{
    std::vector<point_pair_distance> result;
    if (points.size() < 2)
    {
        return result;
    }
    result.reserve(points.size() * (points.size() - 1) / 2);
    for (size_t i = 0; i < points.size(); i++)
    {
        const GeographicCoordinate from = reproject(points[i].coordinate, datum_id);
        for (size_t j = i + 1; j < points.size(); j++)
        {
            result.push_back({points[i].name, points[j].name, distance(from, reproject(points[j].coordinate, datum_id))});
        }
    }
    return result;
}

std::vector<point_pair_distance> distancesLine(const std::vector<Point> &points, DatumId datum_id)
{
    std::vector<point_pair_distance> result;
    for (size_t i = 1; i < points.size(); i++)
    {
        result.push_back({points[i - 1].name, points[i].name,
                          distance(reproject(points[i - 1].coordinate, datum_id),
                                   reproject(points[i].coordinate, datum_id))});
    }
    return result;
}

double totalDistance(const std::vector<point_pair_distance> &distances)
{
    double total = 0;
    for (const auto &d : distances)
    {
        total += d.meters;
    }
    return total;
}

} // namespace geomark
