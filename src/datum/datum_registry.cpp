#include <geomark/datum/datum_registry.hpp>

#include <geomark/types/errors.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace
{
using namespace geomark;

// NAD83 and ETRS89 are realised on GRS 1980 and coincide with WGS84 at the metre level, so the
// published null transformations (EPSG:1188 and EPSG:1149) are used for the shift.
const std::array<Datum, 3> DATUMS = {{
    {DatumId::WGS84, "WGS84", "WGS 84", 6378137.0, 298.257223563, {}},
    {DatumId::NAD83, "NAD83", "GRS 1980", 6378137.0, 298.257222101, {}},
    {DatumId::ETRS89, "ETRS89", "GRS 1980", 6378137.0, 298.257222101, {}},
}};

std::string normalize(const std::string &s)
{
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string result;
    if (begin < end)
    {
        result.assign(begin, end);
    }
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::toupper(c); });
    return result;
}
} // namespace

namespace geomark
{

const Datum &datum(DatumId id)
{
    for (const auto &d : DATUMS)
    {
        if (d.id == id)
        {
            return d;
        }
    }
    throw UnknownDatumError(std::to_string(static_cast<int>(id)));
}

const Datum &resolveDatum(const std::string &identifier)
{
    return datum(resolveDatumId(identifier));
}

std::optional<DatumId> findDatumId(const std::string &identifier)
{
    return stringToDatumId(normalize(identifier));
}

DatumId resolveDatumId(const std::string &identifier)
{
    auto id = findDatumId(identifier);
    if (!id.has_value())
    {
        throw UnknownDatumError(identifier);
    }
    return *id;
}

const std::vector<DatumId> &supportedDatums()
{
    static const std::vector<DatumId> ids = {DatumId::WGS84, DatumId::NAD83, DatumId::ETRS89};
    return ids;
}

} // namespace geomark
