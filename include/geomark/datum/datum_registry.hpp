#pragma once

#include <geomark/types/datum.hpp>

#include <optional>
#include <string>
#include <vector>

namespace geomark
{

constexpr DatumId DEFAULT_DATUM = DatumId::WGS84;

const Datum &datum(DatumId id);

// case-insensitive, throws UnknownDatumError
const Datum &resolveDatum(const std::string &identifier);
DatumId resolveDatumId(const std::string &identifier);
std::optional<DatumId> findDatumId(const std::string &identifier);

const std::vector<DatumId> &supportedDatums();

} // namespace geomark
