#include <geomark/io/settings.hpp>

#include <geomark/datum/datum_registry.hpp>

#include <spdlog/spdlog.h>

#define RAPIDJSON_HAS_STDSTRING 1
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>
#include <iterator>

namespace geomark
{

bool saveSettings(const Settings &settings, const std::string &path)
{
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("version");
    writer.Int(1);

    writer.Key("default_datum");
    writer.String(datumIdToString(settings.default_datum).c_str());

    writer.Key("document_name");
    writer.String(settings.document_name.c_str());

    writer.Key("compression_level");
    writer.Int(settings.compression_level);

    writer.Key("coordinate_precision");
    writer.Int(settings.coordinate_precision);

    writer.EndObject();

    std::ofstream out(path);
    if (!out.is_open())
    {
        spdlog::error("Failed to open {} for writing", path);
        return false;
    }
    out << buffer.GetString();
    return true;
}

bool loadSettings(const std::string &path, Settings &settings)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        spdlog::error("Failed to open {} for reading", path);
        return false;
    }

    std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    rapidjson::Document doc;
    if (doc.Parse(json.c_str()).HasParseError() || !doc.IsObject())
    {
        spdlog::error("Failed to parse settings file {}", path);
        return false;
    }

    if (!doc.HasMember("version") || !doc["version"].IsInt() || doc["version"].GetInt() != 1)
    {
        spdlog::error("Unsupported settings version in {}", path);
        return false;
    }

    Settings loaded = settings;

    if (doc.HasMember("default_datum"))
    {
        if (!doc["default_datum"].IsString())
        {
            spdlog::error("default_datum must be a string");
            return false;
        }
        auto id = findDatumId(doc["default_datum"].GetString());
        if (!id.has_value())
        {
            spdlog::error("Unknown default_datum '{}' in {}", doc["default_datum"].GetString(), path);
            return false;
        }
        loaded.default_datum = *id;
    }

    if (doc.HasMember("document_name") && doc["document_name"].IsString())
    {
        loaded.document_name = doc["document_name"].GetString();
    }

    if (doc.HasMember("compression_level"))
    {
        if (!doc["compression_level"].IsInt() || doc["compression_level"].GetInt() < 0 ||
            doc["compression_level"].GetInt() > 9)
        {
            spdlog::error("compression_level must be an integer in [0, 9]");
            return false;
        }
        loaded.compression_level = doc["compression_level"].GetInt();
    }

    if (doc.HasMember("coordinate_precision"))
    {
        if (!doc["coordinate_precision"].IsInt() || doc["coordinate_precision"].GetInt() < 0 ||
            doc["coordinate_precision"].GetInt() > 15)
        {
            spdlog::error("coordinate_precision must be an integer in [0, 15]");
            return false;
        }
        loaded.coordinate_precision = doc["coordinate_precision"].GetInt();
    }

    settings = loaded;
    return true;
}

} // namespace geomark
