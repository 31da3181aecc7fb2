#pragma once

#include <geomark/types/datum.hpp>
#include <geomark/types/geographic_coordinate.hpp>

#include <eigen3/Eigen/Core>

namespace geomark
{

// earth-centred earth-fixed position of a coordinate at ellipsoidal height height_m
Eigen::Vector3d toEcef(const GeographicCoordinate &coordinate, double height_m = 0);
GeographicCoordinate fromEcef(const Eigen::Vector3d &ecef, DatumId datum, double *height_m = nullptr);

// to WGS84 with inverse false, back from WGS84 with inverse true
Eigen::Vector3d helmertTransform(const helmert_parameters &p, const Eigen::Vector3d &xyz, bool inverse);

// through WGS84 using each datum's Helmert parameters; the same datum returns the input unchanged
GeographicCoordinate reproject(const GeographicCoordinate &coordinate, DatumId target);

} // namespace geomark
