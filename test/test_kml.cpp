#include <geomark/io/kml.hpp>
#include <geomark/types/errors.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace geomark;

namespace
{
Document sampleDocument()
{
    Document doc;
    doc.name = "Survey";

    Point plain;
    plain.name = "Point_1";
    plain.coordinate = {40.0151, -3.6531, DatumId::WGS84};
    doc.points.add(plain);

    Point detailed;
    detailed.name = "Mast & Tower";
    detailed.coordinate = {-33.8688, 151.2093, DatumId::WGS84};
    detailed.altitude = 58.25;
    detailed.description = "north <side>";
    detailed.style_url = "#red";
    doc.points.add(detailed);

    return doc;
}
} // namespace

TEST(kml, writes_document_structure)
{
    const std::string markup = toKml(sampleDocument());

    EXPECT_NE(markup.find("<?xml version=\"1.0\""), std::string::npos);
    EXPECT_NE(markup.find("<kml xmlns=\"http://www.opengis.net/kml/2.2\">"), std::string::npos);
    EXPECT_NE(markup.find("<name>Survey</name>"), std::string::npos);
    EXPECT_NE(markup.find("<coordinates>-3.6531000000,40.0151000000</coordinates>"), std::string::npos);
    EXPECT_NE(markup.find("<coordinates>151.2093000000,-33.8688000000,58.250</coordinates>"), std::string::npos);
    EXPECT_NE(markup.find("<name>Mast &amp; Tower</name>"), std::string::npos);
    EXPECT_NE(markup.find("<styleUrl>#red</styleUrl>"), std::string::npos);
    EXPECT_NE(markup.find("<Data name=\"datum\">"), std::string::npos);
}

TEST(kml, coordinate_precision_option)
{
    kml_options options;
    options.coordinate_precision = 3;
    const std::string markup = toKml(sampleDocument(), options);

    EXPECT_NE(markup.find("<coordinates>-3.653,40.015</coordinates>"), std::string::npos);
}

TEST(kml, reads_back_what_it_writes)
{
    const DeserializeResult result = fromKml(toKml(sampleDocument()));

    EXPECT_EQ(result.document.name, "Survey");
    EXPECT_EQ(result.report.accepted, (std::vector<std::string>{"Point_1", "Mast & Tower"}));
    EXPECT_TRUE(result.report.skipped.empty());
    EXPECT_TRUE(result.report.defaulted.empty());

    ASSERT_EQ(result.document.points.size(), 2u);
    const Point &detailed = result.document.points.get("Mast & Tower");
    EXPECT_NEAR(detailed.coordinate.latitude, -33.8688, 1e-9);
    EXPECT_NEAR(detailed.coordinate.longitude, 151.2093, 1e-9);
    ASSERT_TRUE(detailed.altitude.has_value());
    EXPECT_NEAR(*detailed.altitude, 58.25, 1e-9);
    EXPECT_EQ(detailed.description, std::optional<std::string>("north <side>"));
    EXPECT_EQ(detailed.style_url, std::optional<std::string>("#red"));

    const Point &plain = result.document.points.get("Point_1");
    EXPECT_FALSE(plain.altitude.has_value());
    EXPECT_FALSE(plain.description.has_value());
}

TEST(kml, other_datums_are_restored)
{
    Document doc;
    doc.points.add("nad", {45.0, -75.0, DatumId::NAD83});
    doc.points.add("etrs", {52.52, 13.405, DatumId::ETRS89});

    const DeserializeResult result = fromKml(toKml(doc));
    const Point &nad = result.document.points.get("nad");
    EXPECT_EQ(nad.coordinate.datum, DatumId::NAD83);
    EXPECT_NEAR(nad.coordinate.latitude, 45.0, 1e-9);
    EXPECT_NEAR(nad.coordinate.longitude, -75.0, 1e-9);
    EXPECT_EQ(result.document.points.get("etrs").coordinate.datum, DatumId::ETRS89);
}

TEST(kml, free_text_keeps_surrounding_whitespace)
{
    Document doc;
    Point p;
    p.name = "Gate 2";
    p.coordinate = {10.0, 20.0, DatumId::WGS84};
    p.description = "  indented\nsecond line  ";
    doc.points.add(p);

    const DeserializeResult result = fromKml(toKml(doc));
    EXPECT_EQ(result.report.accepted, (std::vector<std::string>{"Gate 2"}));
    EXPECT_EQ(result.document.points.get("Gate 2").description, p.description);

    // names are trimmed on read, so a document never holds one that would change
    EXPECT_THROW(doc.points.add(" Gate 3", {1.0, 1.0, DatumId::WGS84}), std::invalid_argument);
}

TEST(kml, datum_values_ignore_case)
{
    const std::string markup = R"(<kml xmlns="http://www.opengis.net/kml/2.2"><Document><name>D</name>
  <Placemark>
    <name>Berlin</name>
    <ExtendedData><Data name="datum"><value>etrs89</value></Data></ExtendedData>
    <Point><coordinates>13.405,52.52</coordinates></Point>
  </Placemark>
</Document></kml>)";

    const DeserializeResult result = fromKml(markup);
    EXPECT_TRUE(result.report.defaulted.empty());
    EXPECT_EQ(result.document.points.get("Berlin").coordinate.datum, DatumId::ETRS89);
}

TEST(kml, best_effort_on_foreign_documents)
{
    const std::string markup = R"(<?xml version="1.0" encoding="UTF-8"?>
<kml xmlns="http://www.opengis.net/kml/2.2">
  <Document>
    <Folder>
      <name>Trip</name>
      <Placemark><name>Camp</name><Point><coordinates> 7.5,46.1,1200 </coordinates></Point></Placemark>
      <Folder>
        <Placemark><name>Summit</name><Point><coordinates>7.6,46.0</coordinates></Point></Placemark>
      </Folder>
    </Folder>
    <Placemark><Point><coordinates>1,1</coordinates></Point></Placemark>
    <Placemark><name>Route</name><LineString><coordinates>1,1 2,2</coordinates></LineString></Placemark>
    <Placemark><name>Camp</name><Point><coordinates>8,47</coordinates></Point></Placemark>
    <Placemark><name>Nowhere</name><Point><coordinates>200,10</coordinates></Point></Placemark>
    <Placemark><name>Garbled</name><Point><coordinates>east,north</coordinates></Point></Placemark>
    <Placemark>
      <name>Old</name>
      <ExtendedData><Data name="datum"><value>ED50</value></Data></ExtendedData>
      <Point><coordinates>2,41</coordinates></Point>
    </Placemark>
  </Document>
</kml>)";

    const DeserializeResult result = fromKml(markup);

    EXPECT_EQ(result.document.name, "Untitled");
    EXPECT_EQ(result.report.accepted, (std::vector<std::string>{"Camp", "Summit", "Old"}));

    const Point &camp = result.document.points.get("Camp");
    EXPECT_DOUBLE_EQ(camp.coordinate.longitude, 7.5);
    EXPECT_DOUBLE_EQ(*camp.altitude, 1200.0);
    EXPECT_EQ(result.document.points.get("Old").coordinate.datum, DatumId::WGS84);

    ASSERT_EQ(result.report.skipped.size(), 5u);
    EXPECT_EQ(result.report.skipped[0].name, "");
    EXPECT_EQ(result.report.skipped[1].name, "Route");
    EXPECT_EQ(result.report.skipped[1].reason, "not a point placemark");
    EXPECT_EQ(result.report.skipped[2].name, "Camp");
    EXPECT_EQ(result.report.skipped[2].reason, "duplicate name");
    EXPECT_EQ(result.report.skipped[3].name, "Nowhere");
    EXPECT_EQ(result.report.skipped[4].name, "Garbled");

    ASSERT_EQ(result.report.defaulted.size(), 2u);
    EXPECT_NE(result.report.defaulted[0].find("Untitled"), std::string::npos);
    EXPECT_NE(result.report.defaulted[1].find("ED50"), std::string::npos);
}

TEST(kml, prefixed_elements)
{
    const std::string markup = R"(<kml:kml xmlns:kml="http://www.opengis.net/kml/2.2">
  <kml:Document><kml:name>Prefixed</kml:name>
    <kml:Placemark><kml:name>A</kml:name><kml:Point><kml:coordinates>1,2</kml:coordinates></kml:Point></kml:Placemark>
  </kml:Document>
</kml:kml>)";

    const DeserializeResult result = fromKml(markup);
    EXPECT_EQ(result.document.name, "Prefixed");
    ASSERT_EQ(result.document.points.size(), 1u);
    EXPECT_DOUBLE_EQ(result.document.points.get("A").coordinate.latitude, 2.0);
}

TEST(kml, malformed_markup)
{
    EXPECT_THROW(fromKml(""), MalformedMarkupError);
    EXPECT_THROW(fromKml("<kml><Document></kml>"), MalformedMarkupError);
    EXPECT_THROW(fromKml("<gpx><wpt/></gpx>"), MalformedMarkupError);
}

TEST(kml, empty_document)
{
    Document doc;
    doc.name = "Nothing here";
    const DeserializeResult result = fromKml(toKml(doc));

    EXPECT_EQ(result.document.name, "Nothing here");
    EXPECT_TRUE(result.document.points.empty());
}
