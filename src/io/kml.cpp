#include <geomark/io/kml.hpp>

#include <geomark/datum/datum_registry.hpp>
#include <geomark/projection/datum_shift.hpp>
#include <geomark/types/errors.hpp>

#include <pugixml.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <optional>
#include <sstream>
#include <vector>

namespace
{

constexpr const char *KML_NAMESPACE = "http://www.opengis.net/kml/2.2";
constexpr const char *DATUM_DATA_NAME = "datum";

// element name without any namespace prefix, "kml:Placemark" -> "Placemark"
std::string localName(const pugi::xml_node &node)
{
    const std::string name = node.name();
    const auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

pugi::xml_node child(const pugi::xml_node &node, const std::string &name)
{
    for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling())
    {
        if (c.type() == pugi::node_element && localName(c) == name)
            return c;
    }
    return pugi::xml_node();
}

std::string trim(const std::string &str)
{
    size_t begin = 0, end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])))
        begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])))
        end--;
    return str.substr(begin, end - begin);
}

std::string childText(const pugi::xml_node &node, const std::string &name)
{
    return trim(child(node, name).child_value());
}

void collectPlacemarks(const pugi::xml_node &node, std::vector<pugi::xml_node> &placemarks)
{
    for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling())
    {
        if (c.type() != pugi::node_element)
            continue;
        if (localName(c) == "Placemark")
            placemarks.push_back(c);
        else
            collectPlacemarks(c, placemarks);
    }
}

bool parseNumber(const std::string &str, double &value)
{
    if (str.empty())
        return false;
    char *end = nullptr;
    value = std::strtod(str.c_str(), &end);
    return end == str.c_str() + str.size() && std::isfinite(value);
}

// first "lon,lat[,alt]" tuple of a coordinates element
bool parseCoordinates(const std::string &text, double &longitude, double &latitude, std::optional<double> &altitude)
{
    std::istringstream tuples(text);
    std::string tuple;
    if (!(tuples >> tuple))
        return false;

    std::vector<std::string> fields;
    std::istringstream parts(tuple);
    std::string field;
    while (std::getline(parts, field, ','))
        fields.push_back(field);

    if (fields.size() < 2 || fields.size() > 3)
        return false;
    if (!parseNumber(fields[0], longitude) || !parseNumber(fields[1], latitude))
        return false;

    altitude.reset();
    if (fields.size() == 3)
    {
        double alt;
        if (!parseNumber(fields[2], alt))
            return false;
        altitude = alt;
    }
    return true;
}

std::string datumData(const pugi::xml_node &placemark)
{
    pugi::xml_node extended = child(placemark, "ExtendedData");
    for (pugi::xml_node data = extended.first_child(); data; data = data.next_sibling())
    {
        if (data.type() == pugi::node_element && localName(data) == "Data" &&
            std::string(data.attribute("name").value()) == DATUM_DATA_NAME)
        {
            return childText(data, "value");
        }
    }
    return "";
}

bool hasOtherGeometry(const pugi::xml_node &placemark)
{
    for (const char *geometry : {"LineString", "LinearRing", "Polygon", "MultiGeometry", "Model", "Track"})
    {
        if (child(placemark, geometry))
            return true;
    }
    return false;
}

std::string formatCoordinates(const geomark::Point &point, int precision)
{
    const geomark::GeographicCoordinate wgs84 = geomark::reproject(point.coordinate, geomark::DatumId::WGS84);

    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << wgs84.longitude << "," << wgs84.latitude;
    if (point.altitude.has_value())
    {
        out << std::setprecision(3) << "," << *point.altitude;
    }
    return out.str();
}

} // namespace

namespace geomark
{

std::string toKml(const Document &document, const kml_options &options)
{
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("kml");
    root.append_attribute("xmlns") = KML_NAMESPACE;

    auto document_node = root.append_child("Document");
    document_node.append_child("name").text().set(document.name.c_str());

    for (const Point &point : document.points)
    {
        auto placemark = document_node.append_child("Placemark");
        placemark.append_child("name").text().set(point.name.c_str());
        if (point.description.has_value())
            placemark.append_child("description").text().set(point.description->c_str());
        if (point.style_url.has_value())
            placemark.append_child("styleUrl").text().set(point.style_url->c_str());

        auto data = placemark.append_child("ExtendedData").append_child("Data");
        data.append_attribute("name") = DATUM_DATA_NAME;
        data.append_child("value").text().set(datumIdToString(point.coordinate.datum).c_str());

        placemark.append_child("Point")
            .append_child("coordinates")
            .text()
            .set(formatCoordinates(point, options.coordinate_precision).c_str());
    }

    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

DeserializeResult fromKml(const std::string &markup)
{
    pugi::xml_document doc;
    pugi::xml_parse_result res = doc.load_buffer(markup.data(), markup.size());
    if (!res)
    {
        throw MalformedMarkupError("KML parse error: " + std::string(res.description()) + " (offset " +
                                   std::to_string(res.offset) + ")");
    }

    pugi::xml_node root = doc.document_element();
    if (!root || localName(root) != "kml")
    {
        throw MalformedMarkupError("Missing root <kml> element");
    }

    DeserializeResult result;

    pugi::xml_node container = child(root, "Document");
    if (!container)
        container = child(root, "Folder");
    const std::string document_name = container ? childText(container, "name") : "";
    if (document_name.empty())
    {
        result.report.defaulted.push_back("document name: Untitled");
    }
    else
    {
        result.document.name = document_name;
    }

    std::vector<pugi::xml_node> placemarks;
    collectPlacemarks(root, placemarks);

    for (const pugi::xml_node &placemark : placemarks)
    {
        Point point;
        point.name = childText(placemark, "name");
        if (point.name.empty())
        {
            result.report.skipped.push_back({0, "", "placemark has no name"});
            continue;
        }

        pugi::xml_node point_node = child(placemark, "Point");
        if (!point_node)
        {
            const std::string reason =
                hasOtherGeometry(placemark) ? "not a point placemark" : "placemark has no point coordinates";
            result.report.skipped.push_back({0, point.name, reason});
            continue;
        }

        double longitude = 0, latitude = 0;
        if (!parseCoordinates(childText(point_node, "coordinates"), longitude, latitude, point.altitude))
        {
            result.report.skipped.push_back({0, point.name, "unreadable coordinates"});
            continue;
        }

        // free text keeps its surrounding whitespace
        const std::string description = child(placemark, "description").child_value();
        if (!trim(description).empty())
            point.description = description;
        const std::string style = childText(placemark, "styleUrl");
        if (!style.empty())
            point.style_url = style;

        DatumId datum_id = DatumId::WGS84;
        const std::string datum_name = datumData(placemark);
        if (!datum_name.empty())
        {
            auto parsed = findDatumId(datum_name);
            if (parsed.has_value())
            {
                datum_id = *parsed;
            }
            else
            {
                result.report.defaulted.push_back(point.name + ": unknown datum '" + datum_name + "', using WGS84");
            }
        }

        if (std::abs(latitude) > 90 || std::abs(longitude) > 180)
        {
            result.report.skipped.push_back({0, point.name, "coordinate out of range"});
            continue;
        }

        try
        {
            point.coordinate = reproject(GeographicCoordinate{latitude, longitude, DatumId::WGS84}, datum_id);
            result.document.points.add(point);
            result.report.accepted.push_back(point.name);
        }
        catch (const DuplicateNameError &)
        {
            result.report.skipped.push_back({0, point.name, "duplicate name"});
        }
        catch (const OutOfRangeError &e)
        {
            result.report.skipped.push_back({0, point.name, e.what()});
        }
    }

    for (const auto &skipped : result.report.skipped)
    {
        spdlog::warn("Skipped placemark '{}': {}", skipped.name, skipped.reason);
    }
    for (const auto &defaulted : result.report.defaulted)
    {
        spdlog::warn("Defaulted {}", defaulted);
    }

    return result;
}

} // namespace geomark
