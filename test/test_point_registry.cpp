#include <geomark/projection/utm_projection.hpp>
#include <geomark/registry/point_registry.hpp>
#include <geomark/types/errors.hpp>

#include <gtest/gtest.h>

using namespace geomark;

class PointRegistryTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        registry.add("Point_1", {40.0151, -3.6531, DatumId::WGS84});
        registry.add("Point_2", {40.4168, -3.7038, DatumId::WGS84});
        registry.add("Point_3", {-33.8688, 151.2093, DatumId::NAD83});
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> result;
        for (const auto &p : registry)
            result.push_back(p.name);
        return result;
    }

    PointRegistry registry;
};

TEST_F(PointRegistryTest, add_keeps_insertion_order)
{
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_EQ(names(), (std::vector<std::string>{"Point_1", "Point_2", "Point_3"}));
    EXPECT_DOUBLE_EQ(registry.get("Point_1").coordinate.latitude, 40.0151);
    EXPECT_EQ(registry.get("Point_3").coordinate.datum, DatumId::NAD83);
}

TEST_F(PointRegistryTest, duplicate_name_rejected)
{
    EXPECT_THROW(registry.add("Point_1", {10.0, 10.0, DatumId::WGS84}), DuplicateNameError);
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_DOUBLE_EQ(registry.get("Point_1").coordinate.latitude, 40.0151);

    try
    {
        registry.add("Point_2", {0, 0, DatumId::WGS84});
        FAIL() << "expected DuplicateNameError";
    }
    catch (const DuplicateNameError &e)
    {
        EXPECT_EQ(e.name(), "Point_2");
    }
}

TEST_F(PointRegistryTest, names_are_case_sensitive)
{
    registry.add("point_1", {1.0, 1.0, DatumId::WGS84});
    EXPECT_EQ(registry.size(), 4u);
    EXPECT_TRUE(registry.contains("point_1"));
    EXPECT_TRUE(registry.contains("Point_1"));
}

TEST_F(PointRegistryTest, invalid_points_rejected)
{
    EXPECT_THROW(registry.add("", {0, 0, DatumId::WGS84}), std::invalid_argument);
    EXPECT_THROW(registry.add(" A", {0, 0, DatumId::WGS84}), std::invalid_argument);
    EXPECT_THROW(registry.add("A\t", {0, 0, DatumId::WGS84}), std::invalid_argument);
    EXPECT_THROW(registry.add("   ", {0, 0, DatumId::WGS84}), std::invalid_argument);
    EXPECT_THROW(registry.add("high", {90.5, 0, DatumId::WGS84}), OutOfRangeError);
    EXPECT_THROW(registry.add("east", {0, 180.5, DatumId::WGS84}), OutOfRangeError);
    EXPECT_EQ(registry.size(), 3u);

    // poles are valid geographic coordinates even though they have no UTM form
    registry.add("north_pole", {90.0, 0, DatumId::WGS84});
    EXPECT_EQ(registry.size(), 4u);
}

TEST_F(PointRegistryTest, add_from_utm)
{
    UtmCoordinate utm;
    utm.zone = parseZoneTag("10T");
    utm.easting = 0;
    utm.northing = 0;
    registry.addFromUtm("Point_x", utm);

    const Point &p = registry.get("Point_x");
    EXPECT_NEAR(p.coordinate.latitude, 0.0, 1e-9);
    EXPECT_NEAR(p.coordinate.longitude, -127.4887438843872, 1e-9);
    EXPECT_EQ(names().back(), "Point_x");

    utm.zone.number = 61;
    EXPECT_THROW(registry.addFromUtm("Point_y", utm), InvalidZoneError);
    EXPECT_THROW(registry.addFromUtm("Point_x", toUtm({1.0, -123.0, DatumId::WGS84})), DuplicateNameError);
    EXPECT_EQ(registry.size(), 4u);
}

TEST_F(PointRegistryTest, rename_keeps_coordinates_and_order)
{
    const GeographicCoordinate before = registry.get("Point_2").coordinate;
    registry.rename("Point_2", "Madrid");

    EXPECT_FALSE(registry.contains("Point_2"));
    EXPECT_EQ(registry.get("Madrid").coordinate, before);
    EXPECT_EQ(names(), (std::vector<std::string>{"Point_1", "Madrid", "Point_3"}));
}

TEST_F(PointRegistryTest, rename_failures)
{
    EXPECT_THROW(registry.rename("missing", "other"), NotFoundError);
    EXPECT_THROW(registry.rename("Point_1", "Point_3"), DuplicateNameError);
    EXPECT_THROW(registry.rename("Point_1", ""), std::invalid_argument);
    EXPECT_THROW(registry.rename("Point_1", "Point_1 "), std::invalid_argument);
    EXPECT_EQ(names(), (std::vector<std::string>{"Point_1", "Point_2", "Point_3"}));

    EXPECT_NO_THROW(registry.rename("Point_1", "Point_1"));
    EXPECT_EQ(registry.size(), 3u);
}

TEST_F(PointRegistryTest, move_replaces_coordinate_only)
{
    Point styled;
    styled.name = "styled";
    styled.coordinate = {1.0, 2.0, DatumId::WGS84};
    styled.description = "a description";
    styled.style_url = "#red";
    registry.add(styled);

    registry.move("styled", {3.0, 4.0, DatumId::ETRS89});
    const Point &p = registry.get("styled");
    EXPECT_EQ(p.coordinate, (GeographicCoordinate{3.0, 4.0, DatumId::ETRS89}));
    EXPECT_EQ(p.description, styled.description);
    EXPECT_EQ(p.style_url, styled.style_url);

    EXPECT_THROW(registry.move("missing", {0, 0, DatumId::WGS84}), NotFoundError);
    EXPECT_THROW(registry.move("styled", {100, 0, DatumId::WGS84}), OutOfRangeError);
    EXPECT_EQ(registry.get("styled").coordinate.latitude, 3.0);
}

TEST_F(PointRegistryTest, move_from_utm)
{
    UtmCoordinate utm;
    utm.zone = parseZoneTag("30T");
    utm.easting = 463712.5;
    utm.northing = 4469224.7;
    registry.moveFromUtm("Point_1", utm);

    EXPECT_NEAR(registry.get("Point_1").coordinate.latitude, 40.37281181, 1e-7);
    EXPECT_NEAR(registry.get("Point_1").coordinate.longitude, -3.42744581, 1e-7);
    EXPECT_THROW(registry.moveFromUtm("missing", utm), NotFoundError);
}

TEST_F(PointRegistryTest, remove_preserves_relative_order)
{
    registry.remove("Point_2");
    EXPECT_EQ(names(), (std::vector<std::string>{"Point_1", "Point_3"}));
    EXPECT_THROW(registry.remove("Point_2"), NotFoundError);
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(PointRegistryTest, lookup)
{
    EXPECT_TRUE(registry.find("Point_1").has_value());
    EXPECT_FALSE(registry.find("nope").has_value());
    EXPECT_THROW(registry.get("nope"), NotFoundError);

    registry.clear();
    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(registry.list().empty());
}

TEST(point_registry, bulk_add_skips_only_bad_entries)
{
    std::vector<bulk_entry> entries;
    for (size_t i = 1; i <= 10; i++)
    {
        bulk_entry e;
        e.line_number = i;
        e.name = "P" + std::to_string(i);
        e.easting = 440000 + 100.0 * i;
        e.northing = 4474000;
        e.zone_tag = i == 4 ? "30Z" : "30T";
        entries.push_back(e);
    }

    PointRegistry registry;
    const BulkImportReport report = registry.addBulk(entries);

    EXPECT_EQ(report.accepted.size(), 9u);
    EXPECT_EQ(registry.size(), 9u);
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].line_number, 4u);
    EXPECT_EQ(report.skipped[0].name, "P4");
    EXPECT_FALSE(registry.contains("P4"));
    EXPECT_EQ(registry.list()[3].name, "P5");
}

TEST(point_registry, bulk_add_reports_each_failure_kind)
{
    std::vector<bulk_entry> entries = {
        {1, "A", 440000, 4474000, "30T", ""},
        {2, "A", 441000, 4474000, "30T", ""},      // duplicate
        {3, "B", 441000, 4474000, "30T", "ED50"},  // unknown datum
        {4, "C", 500000, 9500000, "30T", ""},      // beyond 84 degrees
        {5, "D", 442000, 4474000, "30T", "nad83"}, // datum resolved case-insensitively
    };

    PointRegistry registry;
    const BulkImportReport report = registry.addBulk(entries, DatumId::ETRS89);

    EXPECT_EQ(report.accepted, (std::vector<std::string>{"A", "D"}));
    ASSERT_EQ(report.skipped.size(), 3u);
    EXPECT_EQ(report.skipped[0].line_number, 2u);
    EXPECT_EQ(report.skipped[1].line_number, 3u);
    EXPECT_EQ(report.skipped[2].line_number, 4u);
    EXPECT_NE(report.skipped[1].reason.find("ED50"), std::string::npos);

    EXPECT_EQ(registry.get("A").coordinate.datum, DatumId::ETRS89);
    EXPECT_EQ(registry.get("D").coordinate.datum, DatumId::NAD83);
}
