#pragma once

#include <geomark/io/kml.hpp>
#include <geomark/types/document.hpp>

#include <string>

namespace geomark
{

constexpr const char *KMZ_MARKUP_ENTRY = "doc.kml";

struct kmz_options
{
    int compression_level = 6; // zlib level, 0 stores the markup uncompressed
    kml_options markup;
};

// zip archive holding the document markup as doc.kml
std::string serialize(const Document &document, const kmz_options &options = kmz_options());

/**
 * Reconstructs a document from KMZ bytes. The markup is read from doc.kml, or from the first .kml
 * entry when an archive written by another tool names it differently.
 *
 * Throws MalformedArchiveError, MissingMarkupError or MalformedMarkupError.
 */
DeserializeResult deserialize(const std::string &bytes);

// file wrappers, throw FileAccessError when the path cannot be written or read
void saveKmz(const Document &document, const std::string &path, const kmz_options &options = kmz_options());
DeserializeResult loadKmz(const std::string &path);

} // namespace geomark
