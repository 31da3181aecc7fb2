#include <geomark/projection/datum_shift.hpp>

#include <geomark/datum/datum_registry.hpp>

#include <spdlog/spdlog.h>

#include <eigen3/Eigen/Geometry>

#include <cmath>

namespace
{
constexpr double DEG2RAD = M_PI / 180.0;
constexpr double RAD2DEG = 180.0 / M_PI;
constexpr double ARCSEC2RAD = DEG2RAD / 3600.0;
} // namespace

namespace geomark
{

// position vector convention, small angle rotation
Eigen::Vector3d helmertTransform(const helmert_parameters &p, const Eigen::Vector3d &xyz, bool inverse)
{
    const double sign = inverse ? -1.0 : 1.0;
    const Eigen::Vector3d t(p.tx_m, p.ty_m, p.tz_m);
    const double rx = sign * p.rx_arcsec * ARCSEC2RAD;
    const double ry = sign * p.ry_arcsec * ARCSEC2RAD;
    const double rz = sign * p.rz_arcsec * ARCSEC2RAD;
    const double scale = 1.0 + sign * p.scale_ppm * 1e-6;

    Eigen::Matrix3d rotation;
    rotation << 1, -rz, ry, rz, 1, -rx, -ry, rx, 1;

    if (inverse)
    {
        return scale * rotation * (xyz - t);
    }
    return scale * rotation * xyz + t;
}

Eigen::Vector3d toEcef(const GeographicCoordinate &coordinate, double height_m)
{
    const Datum &d = datum(coordinate.datum);
    const double e2 = d.eccentricitySquared();
    const double phi = coordinate.latitude * DEG2RAD;
    const double lambda = coordinate.longitude * DEG2RAD;

    const double sin_phi = std::sin(phi);
    const double N = d.semi_major_axis / std::sqrt(1.0 - e2 * sin_phi * sin_phi);

    return Eigen::Vector3d((N + height_m) * std::cos(phi) * std::cos(lambda),
                           (N + height_m) * std::cos(phi) * std::sin(lambda), (N * (1.0 - e2) + height_m) * sin_phi);
}

GeographicCoordinate fromEcef(const Eigen::Vector3d &ecef, DatumId id, double *height_m)
{
    const Datum &d = datum(id);
    const double a = d.semi_major_axis;
    const double e2 = d.eccentricitySquared();
    const double p = std::hypot(ecef.x(), ecef.y());

    // Bowring's initial guess refined by fixed point iteration
    double phi = std::atan2(ecef.z(), p * (1.0 - e2));
    double N = a;
    double h = 0;
    for (int i = 0; i < 10; i++)
    {
        const double sin_phi = std::sin(phi);
        N = a / std::sqrt(1.0 - e2 * sin_phi * sin_phi);
        h = p / std::cos(phi) - N;
        const double next = std::atan2(ecef.z(), p * (1.0 - e2 * N / (N + h)));
        const bool converged = std::abs(next - phi) < 1e-14;
        phi = next;
        if (converged)
        {
            break;
        }
    }

    if (height_m != nullptr)
    {
        *height_m = h;
    }

    GeographicCoordinate result;
    result.latitude = phi * RAD2DEG;
    result.longitude = std::atan2(ecef.y(), ecef.x()) * RAD2DEG;
    result.datum = id;
    return result;
}

GeographicCoordinate reproject(const GeographicCoordinate &coordinate, DatumId target)
{
    if (coordinate.datum == target)
    {
        return coordinate;
    }

    const Datum &source = datum(coordinate.datum);
    const Datum &dest = datum(target);

    Eigen::Vector3d xyz = toEcef(coordinate);
    if (!source.to_wgs84.isNull())
    {
        xyz = helmertTransform(source.to_wgs84, xyz, false);
    }
    if (!dest.to_wgs84.isNull())
    {
        xyz = helmertTransform(dest.to_wgs84, xyz, true);
    }

    double height = 0;
    GeographicCoordinate result = fromEcef(xyz, target, &height);

    spdlog::debug("reprojected {},{} from {} to {} as {},{} (height change {} m)", coordinate.latitude,
                  coordinate.longitude, source.name, dest.name, result.latitude, result.longitude, height);
    return result;
}

} // namespace geomark
