#include <geomark/session/session.hpp>

#include <geomark/io/kmz_codec.hpp>
#include <geomark/types/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace geomark
{

std::string withKmzExtension(const std::string &path)
{
    if (path.size() >= 4)
    {
        std::string ext = path.substr(path.size() - 4);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".kmz")
        {
            return path;
        }
    }
    return path + ".kmz";
}

Session::Session(Settings settings) : _settings(std::move(settings)), _default_datum(_settings.default_datum)
{
}

void Session::create(const std::string &name)
{
    Document document;
    document.name = name.empty() ? _settings.document_name : name;

    _document = std::move(document);
    _path.reset();
    _modified = true;
    _last_open_report = ReadReport();

    spdlog::info("Created document '{}'", _document->name);
}

void Session::open(const std::string &path)
{
    const std::string full_path = withKmzExtension(path);

    // only replace the current document once the whole file has been read
    DeserializeResult result = loadKmz(full_path);

    _document = std::move(result.document);
    _last_open_report = std::move(result.report);
    _path = full_path;
    _modified = false;
}

std::string Session::save(const std::optional<std::string> &path)
{
    const Document &doc = document();

    std::string target;
    if (path.has_value() && !path->empty())
    {
        target = withKmzExtension(*path);
    }
    else if (_path.has_value())
    {
        target = *_path;
    }
    else
    {
        throw FileAccessError("No file name given and the document has not been saved before");
    }

    kmz_options options;
    options.compression_level = _settings.compression_level;
    options.markup.coordinate_precision = _settings.coordinate_precision;
    saveKmz(doc, target, options);

    _path = target;
    _modified = false;
    return target;
}

Document &Session::document()
{
    if (!_document.has_value())
    {
        throw NoDocumentError();
    }
    return *_document;
}

const Document &Session::document() const
{
    if (!_document.has_value())
    {
        throw NoDocumentError();
    }
    return *_document;
}

} // namespace geomark
