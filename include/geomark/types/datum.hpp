#pragma once

#include <optional>
#include <string>

namespace geomark
{

enum class DatumId
{
    WGS84,
    NAD83,
    ETRS89
};

// 7-parameter (position vector) transformation from this datum to WGS84
struct helmert_parameters
{
    double tx_m = 0, ty_m = 0, tz_m = 0;
    double rx_arcsec = 0, ry_arcsec = 0, rz_arcsec = 0;
    double scale_ppm = 0;

    bool isNull() const
    {
        return tx_m == 0 && ty_m == 0 && tz_m == 0 && rx_arcsec == 0 && ry_arcsec == 0 && rz_arcsec == 0 &&
               scale_ppm == 0;
    }
};

struct Datum
{
    DatumId id;
    std::string name;
    std::string ellipsoid_name;
    double semi_major_axis;
    double inverse_flattening;
    helmert_parameters to_wgs84;

    double flattening() const
    {
        return 1.0 / inverse_flattening;
    }

    double semiMinorAxis() const
    {
        return semi_major_axis * (1.0 - flattening());
    }

    // first eccentricity squared
    double eccentricitySquared() const
    {
        const double f = flattening();
        return f * (2.0 - f);
    }
};

inline std::string datumIdToString(DatumId id)
{
    switch (id)
    {
    case DatumId::WGS84:
        return "WGS84";
    case DatumId::NAD83:
        return "NAD83";
    case DatumId::ETRS89:
        return "ETRS89";
    }
    return "";
}

inline std::optional<DatumId> stringToDatumId(const std::string &str)
{
    if (str == "WGS84")
        return DatumId::WGS84;
    if (str == "NAD83")
        return DatumId::NAD83;
    if (str == "ETRS89")
        return DatumId::ETRS89;
    return std::nullopt;
}

} // namespace geomark
