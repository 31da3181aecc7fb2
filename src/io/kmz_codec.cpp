#include <geomark/io/kmz_codec.hpp>

#include <geomark/io/zip_archive.hpp>
#include <geomark/types/errors.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <iterator>

namespace
{

bool hasKmlExtension(const std::string &name)
{
    if (name.size() < 4)
        return false;
    std::string ext = name.substr(name.size() - 4);
    for (char &c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext == ".kml";
}

} // namespace

namespace geomark
{

std::string serialize(const Document &document, const kmz_options &options)
{
    const std::string markup = toKml(document, options.markup);
    return writeZip({{KMZ_MARKUP_ENTRY, markup}}, options.compression_level);
}

DeserializeResult deserialize(const std::string &bytes)
{
    ZipReader archive(bytes);

    std::string entry;
    if (archive.contains(KMZ_MARKUP_ENTRY))
    {
        entry = KMZ_MARKUP_ENTRY;
    }
    else
    {
        for (const auto &name : archive.entryNames())
        {
            if (hasKmlExtension(name))
            {
                entry = name;
                break;
            }
        }
    }

    if (entry.empty())
    {
        throw MissingMarkupError("Archive contains no KML document");
    }

    spdlog::debug("Reading markup from zip entry {}", entry);
    return fromKml(archive.read(entry));
}

void saveKmz(const Document &document, const std::string &path, const kmz_options &options)
{
    const std::string bytes = serialize(document, options);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        spdlog::error("Failed to open {} for writing", path);
        throw FileAccessError("Cannot write " + path);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
    {
        spdlog::error("Failed to write {}", path);
        throw FileAccessError("Cannot write " + path);
    }

    spdlog::info("Saved {} points of '{}' to {}", document.points.size(), document.name, path);
}

DeserializeResult loadKmz(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        spdlog::error("Failed to open {} for reading", path);
        throw FileAccessError("Cannot read " + path);
    }
    const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    DeserializeResult result = deserialize(bytes);
    spdlog::info("Loaded {} points of '{}' from {}", result.document.points.size(), result.document.name, path);
    return result;
}

} // namespace geomark
