#include <geomark/io/point_list.hpp>
#include <geomark/types/errors.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace geomark;

TEST(point_list, parses_separators_comments_and_decimal_commas)
{
    std::istringstream in("# survey points\n"
                          "\n"
                          "Base 463712.5 4469224.7 30T\n"
                          "Mast;463712,5;4469300;30T;ETRS89\r\n"
                          "Well\t440290\t4474257\t30T\n");

    const point_list parsed = parsePointList(in);

    EXPECT_TRUE(parsed.rejected_lines.empty());
    ASSERT_EQ(parsed.entries.size(), 3u);

    EXPECT_EQ(parsed.entries[0].line_number, 3u);
    EXPECT_EQ(parsed.entries[0].name, "Base");
    EXPECT_DOUBLE_EQ(parsed.entries[0].easting, 463712.5);
    EXPECT_DOUBLE_EQ(parsed.entries[0].northing, 4469224.7);
    EXPECT_EQ(parsed.entries[0].zone_tag, "30T");
    EXPECT_TRUE(parsed.entries[0].datum.empty());

    EXPECT_EQ(parsed.entries[1].name, "Mast");
    EXPECT_DOUBLE_EQ(parsed.entries[1].easting, 463712.5);
    EXPECT_EQ(parsed.entries[1].datum, "ETRS89");

    EXPECT_EQ(parsed.entries[2].line_number, 5u);
    EXPECT_EQ(parsed.entries[2].name, "Well");
}

TEST(point_list, rejects_bad_lines)
{
    std::istringstream in("A 1 2\n"
                          "B 440000 4474000 30T WGS84 extra\n"
                          "C east 4474000 30T\n"
                          "D 440000 4474000m 30T\n"
                          "E 440000 4474000 30T\n");

    const point_list parsed = parsePointList(in);

    ASSERT_EQ(parsed.entries.size(), 1u);
    EXPECT_EQ(parsed.entries[0].name, "E");

    ASSERT_EQ(parsed.rejected_lines.size(), 4u);
    for (size_t i = 0; i < 4; i++)
    {
        EXPECT_EQ(parsed.rejected_lines[i].line_number, i + 1);
    }
    EXPECT_EQ(parsed.rejected_lines[2].name, "C");
}

TEST(point_list, import_ten_lines_with_a_bad_zone)
{
    std::ostringstream text;
    for (int i = 1; i <= 10; i++)
    {
        text << "P" << i << " " << 440000 + i * 100 << " 4474000 " << (i == 4 ? "99T" : "30T") << "\n";
    }
    std::istringstream in(text.str());

    PointRegistry registry;
    const BulkImportReport report = importPointList(in, registry, DatumId::WGS84);

    EXPECT_EQ(report.accepted.size(), 9u);
    EXPECT_EQ(registry.size(), 9u);
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].line_number, 4u);
    EXPECT_EQ(report.skipped[0].name, "P4");
}

TEST(point_list, import_merges_rejections_by_line)
{
    std::istringstream in("A 440000 4474000 30T\n"
                          "broken line\n"
                          "A 440100 4474000 30T\n"
                          "B 440200 4474000 30T NAD83\n");

    PointRegistry registry;
    const BulkImportReport report = importPointList(in, registry, DatumId::ETRS89);

    EXPECT_EQ(report.accepted, (std::vector<std::string>{"A", "B"}));
    ASSERT_EQ(report.skipped.size(), 2u);
    EXPECT_EQ(report.skipped[0].line_number, 2u);
    EXPECT_EQ(report.skipped[1].line_number, 3u);
    EXPECT_EQ(registry.get("A").coordinate.datum, DatumId::ETRS89);
    EXPECT_EQ(registry.get("B").coordinate.datum, DatumId::NAD83);
}

TEST(point_list, missing_file)
{
    PointRegistry registry;
    EXPECT_THROW(importPointList(std::string(TEST_DATA_OUTPUT_DIR) + "no_such_list.txt", registry, DatumId::WGS84),
                 FileAccessError);
}
