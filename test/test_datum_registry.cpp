#include <geomark/datum/datum_registry.hpp>
#include <geomark/types/errors.hpp>

#include <gtest/gtest.h>

using namespace geomark;

TEST(datum_registry, resolves_supported_datums)
{
    EXPECT_EQ(resolveDatumId("WGS84"), DatumId::WGS84);
    EXPECT_EQ(resolveDatumId("NAD83"), DatumId::NAD83);
    EXPECT_EQ(resolveDatumId("ETRS89"), DatumId::ETRS89);
}

TEST(datum_registry, resolution_ignores_case_and_whitespace)
{
    EXPECT_EQ(resolveDatumId(" wgs84 "), DatumId::WGS84);
    EXPECT_EQ(resolveDatumId("nad83"), DatumId::NAD83);
    EXPECT_EQ(resolveDatum("\tEtrs89").id, DatumId::ETRS89);
}

TEST(datum_registry, unknown_datum_throws)
{
    EXPECT_THROW(resolveDatumId("ED50"), UnknownDatumError);
    EXPECT_THROW(resolveDatumId(""), UnknownDatumError);
    EXPECT_THROW(resolveDatum("WGS 84"), UnknownDatumError);
}

TEST(datum_registry, ellipsoid_parameters)
{
    const Datum &wgs84 = datum(DatumId::WGS84);
    EXPECT_DOUBLE_EQ(wgs84.semi_major_axis, 6378137.0);
    EXPECT_DOUBLE_EQ(wgs84.inverse_flattening, 298.257223563);
    EXPECT_NEAR(wgs84.semiMinorAxis(), 6356752.314245, 1e-6);
    EXPECT_TRUE(wgs84.to_wgs84.isNull());

    for (DatumId id : {DatumId::NAD83, DatumId::ETRS89})
    {
        const Datum &grs80 = datum(id);
        EXPECT_DOUBLE_EQ(grs80.semi_major_axis, 6378137.0);
        EXPECT_DOUBLE_EQ(grs80.inverse_flattening, 298.257222101);
        EXPECT_NEAR(grs80.semiMinorAxis(), 6356752.314140, 1e-6);
    }
}

TEST(datum_registry, supported_list_and_names)
{
    const auto &ids = supportedDatums();
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(DEFAULT_DATUM, DatumId::WGS84);

    for (DatumId id : ids)
    {
        const std::string name = datumIdToString(id);
        ASSERT_TRUE(stringToDatumId(name).has_value());
        EXPECT_EQ(*stringToDatumId(name), id);
        EXPECT_EQ(resolveDatumId(name), id);
    }
    EXPECT_FALSE(stringToDatumId("wgs84").has_value());
}
