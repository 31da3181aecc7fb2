#include <geomark/projection/utm_projection.hpp>

#include <geomark/datum/datum_registry.hpp>
#include <geomark/types/errors.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cmath>
#include <cstring>

namespace
{
using namespace geomark;

constexpr double DEG2RAD = M_PI / 180.0;
constexpr double RAD2DEG = 180.0 / M_PI;
constexpr const char *BAND_LETTERS = "CDEFGHJKLMNPQRSTUVWX";

// Krueger series coefficients to sixth order in the third flattening n, after
// Karney, "Transverse Mercator with an accuracy of a few nanometers", J. Geodesy 85 (2011)
struct series_coefficients
{
    double rectifying_radius; // A
    std::array<double, 6> alpha;
    std::array<double, 6> beta;
};

series_coefficients computeCoefficients(const Datum &d)
{
    const double n = d.flattening() / (2.0 - d.flattening());
    const double n2 = n * n, n3 = n2 * n, n4 = n3 * n, n5 = n4 * n, n6 = n5 * n;

    series_coefficients c;
    c.rectifying_radius = d.semi_major_axis / (1.0 + n) * (1.0 + n2 / 4.0 + n4 / 64.0 + n6 / 256.0);

    c.alpha = {n / 2.0 - 2.0 * n2 / 3.0 + 5.0 * n3 / 16.0 + 41.0 * n4 / 180.0 - 127.0 * n5 / 288.0 +
                   7891.0 * n6 / 37800.0,
               13.0 * n2 / 48.0 - 3.0 * n3 / 5.0 + 557.0 * n4 / 1440.0 + 281.0 * n5 / 630.0 -
                   1983433.0 * n6 / 1935360.0,
               61.0 * n3 / 240.0 - 103.0 * n4 / 140.0 + 15061.0 * n5 / 26880.0 + 167603.0 * n6 / 181440.0,
               49561.0 * n4 / 161280.0 - 179.0 * n5 / 168.0 + 6601661.0 * n6 / 7257600.0,
               34729.0 * n5 / 80640.0 - 3418889.0 * n6 / 1995840.0,
               212378941.0 * n6 / 319334400.0};

    c.beta = {n / 2.0 - 2.0 * n2 / 3.0 + 37.0 * n3 / 96.0 - n4 / 360.0 - 81.0 * n5 / 512.0 + 96199.0 * n6 / 604800.0,
              n2 / 48.0 + n3 / 15.0 - 437.0 * n4 / 1440.0 + 46.0 * n5 / 105.0 - 1118711.0 * n6 / 3870720.0,
              17.0 * n3 / 480.0 - 37.0 * n4 / 840.0 - 209.0 * n5 / 4480.0 + 5569.0 * n6 / 90720.0,
              4397.0 * n4 / 161280.0 - 11.0 * n5 / 504.0 - 830251.0 * n6 / 7257600.0,
              4583.0 * n5 / 161280.0 - 108847.0 * n6 / 3991680.0,
              20648693.0 * n6 / 638668800.0};
    return c;
}

const series_coefficients &coefficients(DatumId id)
{
    static const std::array<series_coefficients, 3> cache = {
        computeCoefficients(datum(DatumId::WGS84)), computeCoefficients(datum(DatumId::NAD83)),
        computeCoefficients(datum(DatumId::ETRS89))};
    return cache[static_cast<size_t>(id)];
}

// conformal latitude tangent tau' from geodetic tangent tau
double conformalTangent(double tau, double e)
{
    const double sigma = std::sinh(e * std::atanh(e * tau / std::hypot(1.0, tau)));
    return tau * std::hypot(1.0, sigma) - sigma * std::hypot(1.0, tau);
}

// Newton iteration for the geodetic tangent from the conformal one
double geodeticTangent(double tau_prime, double e2)
{
    const double e = std::sqrt(e2);
    double tau = tau_prime;
    for (int i = 0; i < 10; i++)
    {
        const double tau_i_prime = conformalTangent(tau, e);
        const double dtau = (tau_prime - tau_i_prime) / std::hypot(1.0, tau_i_prime) * (1.0 + (1.0 - e2) * tau * tau) /
                            ((1.0 - e2) * std::hypot(1.0, tau));
        tau += dtau;
        if (std::abs(dtau) < 1e-14)
        {
            break;
        }
    }
    return tau;
}

double wrapLongitude(double lon)
{
    while (lon > 180.0)
        lon -= 360.0;
    while (lon < -180.0)
        lon += 360.0;
    return lon;
}

bool isBandLetter(char c)
{
    return c != '\0' && std::strchr(BAND_LETTERS, c) != nullptr;
}

} // namespace

namespace geomark
{

int naturalZone(double longitude)
{
    int zone = static_cast<int>(std::floor((longitude + 180.0) / 6.0)) + 1;
    // longitude 180 is the eastern edge of zone 60
    return zone > 60 ? 60 : zone;
}

double centralMeridian(int zone)
{
    return zone * 6.0 - 183.0;
}

char latitudeBand(double latitude)
{
    int index = static_cast<int>(std::floor((latitude + 80.0) / 8.0));
    if (index < 0)
        index = 0;
    if (index > 19)
        index = 19; // X spans 72..84
    return BAND_LETTERS[index];
}

Hemisphere hemisphereOfBand(char band)
{
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(band)));
    if (!isBandLetter(upper))
    {
        throw InvalidZoneError(std::string("Invalid UTM latitude band '") + band + "'");
    }
    return upper >= 'N' ? Hemisphere::NORTH : Hemisphere::SOUTH;
}

UtmZone parseZoneTag(const std::string &tag)
{
    size_t pos = 0;
    while (pos < tag.size() && std::isdigit(static_cast<unsigned char>(tag[pos])))
    {
        pos++;
    }
    if (pos == 0 || pos > 2)
    {
        throw InvalidZoneError("Malformed UTM zone '" + tag + "', expected e.g. 30T");
    }

    UtmZone zone;
    zone.number = std::stoi(tag.substr(0, pos));
    if (zone.number < 1 || zone.number > 60)
    {
        throw InvalidZoneError("UTM zone " + std::to_string(zone.number) + " outside [1, 60]");
    }

    if (tag.size() - pos != 1)
    {
        throw InvalidZoneError("Malformed UTM zone '" + tag + "', expected a zone number and band letter e.g. 30T");
    }
    const char band = static_cast<char>(std::toupper(static_cast<unsigned char>(tag[pos])));
    zone.hemisphere = hemisphereOfBand(band);
    zone.band = band;
    return zone;
}

std::string zoneTag(const UtmZone &zone)
{
    std::string tag = std::to_string(zone.number);
    if (zone.band.has_value())
    {
        tag += *zone.band;
    }
    else
    {
        tag += zone.hemisphere == Hemisphere::NORTH ? 'N' : 'S';
    }
    return tag;
}

UtmCoordinate toUtm(const GeographicCoordinate &coordinate, std::optional<int> zone_override)
{
    const double lat = coordinate.latitude;
    const double lon = coordinate.longitude;
    if (!std::isfinite(lat) || !std::isfinite(lon))
    {
        throw OutOfRangeError("Non-finite geographic coordinate");
    }
    if (std::abs(lat) > UTM_MAX_LATITUDE)
    {
        throw OutOfRangeError("Latitude " + std::to_string(lat) + " outside the UTM band of +-84 degrees");
    }
    if (std::abs(lon) > 180.0)
    {
        throw OutOfRangeError("Longitude " + std::to_string(lon) + " outside [-180, 180]");
    }

    int zone = naturalZone(lon);
    if (zone_override.has_value())
    {
        if (*zone_override < 1 || *zone_override > 60)
        {
            throw InvalidZoneError("UTM zone override " + std::to_string(*zone_override) + " outside [1, 60]");
        }
        if (*zone_override != zone)
        {
            spdlog::debug("projecting longitude {} into zone {} instead of its natural zone {}", lon, *zone_override,
                          zone);
        }
        zone = *zone_override;
    }

    const Datum &d = datum(coordinate.datum);
    const auto &c = coefficients(coordinate.datum);
    const double e = std::sqrt(d.eccentricitySquared());

    const double phi = lat * DEG2RAD;
    const double lambda = wrapLongitude(lon - centralMeridian(zone)) * DEG2RAD;

    const double tau_prime = conformalTangent(std::tan(phi), e);
    const double xi_prime = std::atan2(tau_prime, std::cos(lambda));
    const double eta_prime = std::asinh(std::sin(lambda) / std::hypot(tau_prime, std::cos(lambda)));

    double xi = xi_prime;
    double eta = eta_prime;
    for (int j = 1; j <= 6; j++)
    {
        xi += c.alpha[j - 1] * std::sin(2 * j * xi_prime) * std::cosh(2 * j * eta_prime);
        eta += c.alpha[j - 1] * std::cos(2 * j * xi_prime) * std::sinh(2 * j * eta_prime);
    }

    UtmCoordinate utm;
    utm.zone.number = zone;
    utm.zone.hemisphere = lat < 0 ? Hemisphere::SOUTH : Hemisphere::NORTH;
    utm.zone.band = latitudeBand(lat);
    utm.easting = UTM_SCALE_FACTOR * c.rectifying_radius * eta + UTM_FALSE_EASTING;
    utm.northing = UTM_SCALE_FACTOR * c.rectifying_radius * xi;
    if (utm.zone.hemisphere == Hemisphere::SOUTH)
    {
        utm.northing += UTM_FALSE_NORTHING_SOUTH;
    }
    utm.datum = coordinate.datum;

    spdlog::debug("projected {},{} ({}) to zone {} E {} N {}", lat, lon, datumIdToString(coordinate.datum),
                  zoneTag(utm.zone), utm.easting, utm.northing);
    return utm;
}

GeographicCoordinate toGeographic(const UtmCoordinate &utm)
{
    if (utm.zone.number < 1 || utm.zone.number > 60)
    {
        throw InvalidZoneError("UTM zone " + std::to_string(utm.zone.number) + " outside [1, 60]");
    }
    if (utm.zone.hemisphere != Hemisphere::NORTH && utm.zone.hemisphere != Hemisphere::SOUTH)
    {
        throw InvalidZoneError("Malformed UTM hemisphere");
    }
    if (utm.zone.band.has_value() && hemisphereOfBand(*utm.zone.band) != utm.zone.hemisphere)
    {
        throw InvalidZoneError(std::string("UTM band '") + *utm.zone.band + "' disagrees with the hemisphere");
    }
    if (!std::isfinite(utm.easting) || !std::isfinite(utm.northing))
    {
        throw OutOfRangeError("Non-finite UTM coordinate");
    }
    if (std::abs(utm.easting - UTM_FALSE_EASTING) > UTM_MAX_EASTING_OFFSET || utm.northing < 0 ||
        utm.northing > UTM_FALSE_NORTHING_SOUTH)
    {
        throw OutOfRangeError("UTM coordinate E " + std::to_string(utm.easting) + " N " +
                              std::to_string(utm.northing) + " outside the transverse Mercator domain");
    }

    const Datum &d = datum(utm.datum);
    const auto &c = coefficients(utm.datum);

    double y = utm.northing;
    if (utm.zone.hemisphere == Hemisphere::SOUTH)
    {
        y -= UTM_FALSE_NORTHING_SOUTH;
    }
    const double x = utm.easting - UTM_FALSE_EASTING;

    const double xi = y / (UTM_SCALE_FACTOR * c.rectifying_radius);
    const double eta = x / (UTM_SCALE_FACTOR * c.rectifying_radius);

    double xi_prime = xi;
    double eta_prime = eta;
    for (int j = 1; j <= 6; j++)
    {
        xi_prime -= c.beta[j - 1] * std::sin(2 * j * xi) * std::cosh(2 * j * eta);
        eta_prime -= c.beta[j - 1] * std::cos(2 * j * xi) * std::sinh(2 * j * eta);
    }

    const double tau_prime = std::sin(xi_prime) / std::hypot(std::sinh(eta_prime), std::cos(xi_prime));
    const double lambda = std::atan2(std::sinh(eta_prime), std::cos(xi_prime));
    const double tau = geodeticTangent(tau_prime, d.eccentricitySquared());

    GeographicCoordinate result;
    result.latitude = std::atan(tau) * RAD2DEG;
    result.longitude = wrapLongitude(centralMeridian(utm.zone.number) + lambda * RAD2DEG);
    result.datum = utm.datum;

    if (std::abs(result.latitude) > UTM_MAX_LATITUDE)
    {
        throw OutOfRangeError("UTM coordinate E " + std::to_string(utm.easting) + " N " +
                              std::to_string(utm.northing) + " lies outside the UTM latitude band");
    }

    // the series only inverts where it is one-to-one, so the result must project back onto the input
    const UtmCoordinate check = toUtm(result, utm.zone.number);
    const double check_y =
        check.zone.hemisphere == Hemisphere::SOUTH ? check.northing - UTM_FALSE_NORTHING_SOUTH : check.northing;
    if (std::abs(check.easting - utm.easting) > UTM_INVERSE_TOLERANCE || std::abs(check_y - y) > UTM_INVERSE_TOLERANCE)
    {
        throw OutOfRangeError("UTM coordinate E " + std::to_string(utm.easting) + " N " +
                              std::to_string(utm.northing) + " has no inverse in zone " + zoneTag(utm.zone));
    }

    spdlog::debug("unprojected zone {} E {} N {} to {},{} ({})", zoneTag(utm.zone), utm.easting, utm.northing,
                  result.latitude, result.longitude, datumIdToString(utm.datum));
    return result;
}

} // namespace geomark
