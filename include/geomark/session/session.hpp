#pragma once

#include <geomark/io/kml.hpp>
#include <geomark/io/settings.hpp>
#include <geomark/types/document.hpp>

#include <optional>
#include <string>
#include <utility>

namespace geomark
{

class Session
{
  public:
    explicit Session(Settings settings = Settings());

    // replaces any open document, an empty name uses the configured document name
    void create(const std::string &name = "");

    // ".kmz" is appended when missing. On failure the open document is left untouched.
    void open(const std::string &path);

    // writes to path, or to the last opened/saved path when none is given, and returns the path used
    std::string save(const std::optional<std::string> &path = std::nullopt);

    bool hasDocument() const
    {
        return _document.has_value();
    }

    Document &document();
    const Document &document() const;

    bool hasUnsavedChanges() const
    {
        return _modified;
    }

    void markModified()
    {
        _modified = true;
    }

    DatumId defaultDatum() const
    {
        return _default_datum;
    }

    void setDefaultDatum(DatumId datum)
    {
        _default_datum = datum;
    }

    // back to the datum of the settings the session was started with
    void resetDefaultDatum()
    {
        _default_datum = _settings.default_datum;
    }

    const std::optional<std::string> &filePath() const
    {
        return _path;
    }

    const ReadReport &lastOpenReport() const
    {
        return _last_open_report;
    }

    const Settings &settings() const
    {
        return _settings;
    }

  private:
    Settings _settings;
    DatumId _default_datum;
    std::optional<Document> _document;
    std::optional<std::string> _path;
    bool _modified = false;
    ReadReport _last_open_report;
};

std::string withKmzExtension(const std::string &path);

} // namespace geomark
