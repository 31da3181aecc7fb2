#include <geomark/io/point_list.hpp>

#include <geomark/types/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <optional>
#include <sstream>

namespace
{

std::vector<std::string> splitFields(std::string line)
{
    std::replace(line.begin(), line.end(), ';', ' ');
    std::istringstream ss(line);
    std::vector<std::string> fields;
    std::string field;
    while (ss >> field)
    {
        fields.push_back(field);
    }
    return fields;
}

// accepts a decimal comma, rejects trailing characters
std::optional<double> parseNumber(std::string text)
{
    std::replace(text.begin(), text.end(), ',', '.');
    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

namespace geomark
{

point_list parsePointList(std::istream &in)
{
    point_list result;
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line))
    {
        line_number++;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }

        auto fields = splitFields(line);
        if (fields.empty() || fields.front().front() == '#')
        {
            continue;
        }

        if (fields.size() != 4 && fields.size() != 5)
        {
            spdlog::warn("line {}: expected 4 or 5 columns, got {}", line_number, fields.size());
            result.rejected_lines.push_back({line_number, fields.front(),
                                             "Invalid line format (expected 4 or 5 columns): " + line});
            continue;
        }

        auto easting = parseNumber(fields[1]);
        auto northing = parseNumber(fields[2]);
        if (!easting.has_value() || !northing.has_value())
        {
            spdlog::warn("line {}: could not read coordinates", line_number);
            result.rejected_lines.push_back({line_number, fields[0], "Could not convert coordinates: " + line});
            continue;
        }

        bulk_entry entry;
        entry.line_number = line_number;
        entry.name = fields[0];
        entry.easting = *easting;
        entry.northing = *northing;
        entry.zone_tag = fields[3];
        if (fields.size() == 5)
        {
            entry.datum = fields[4];
        }
        result.entries.push_back(std::move(entry));
    }

    spdlog::debug("read {} point list entries, rejected {} lines", result.entries.size(),
                  result.rejected_lines.size());
    return result;
}

BulkImportReport importPointList(std::istream &in, PointRegistry &registry, DatumId default_datum)
{
    point_list parsed = parsePointList(in);
    BulkImportReport report = registry.addBulk(parsed.entries, default_datum);

    report.skipped.insert(report.skipped.end(), parsed.rejected_lines.begin(), parsed.rejected_lines.end());
    std::stable_sort(report.skipped.begin(), report.skipped.end(),
                     [](const skipped_entry &a, const skipped_entry &b) { return a.line_number < b.line_number; });
    return report;
}

BulkImportReport importPointList(const std::string &path, PointRegistry &registry, DatumId default_datum)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        spdlog::error("Failed to open point list {}", path);
        throw FileAccessError("Cannot open point list '" + path + "'");
    }
    return importPointList(in, registry, default_datum);
}

} // namespace geomark
