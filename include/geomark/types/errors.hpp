#pragma once

#include <stdexcept>
#include <string>

namespace geomark
{

class GeomarkError : public std::runtime_error
{
  public:
    explicit GeomarkError(const std::string &what) : std::runtime_error(what)
    {
    }
};

class UnknownDatumError : public GeomarkError
{
  public:
    explicit UnknownDatumError(const std::string &identifier)
        : GeomarkError("Unknown datum '" + identifier + "', supported datums are WGS84, NAD83, ETRS89")
    {
    }
};

// latitude, longitude or zone outside the valid projection domain
class OutOfRangeError : public GeomarkError
{
  public:
    using GeomarkError::GeomarkError;
};

class InvalidZoneError : public GeomarkError
{
  public:
    using GeomarkError::GeomarkError;
};

class DuplicateNameError : public GeomarkError
{
  public:
    explicit DuplicateNameError(const std::string &name)
        : GeomarkError("A point named '" + name + "' already exists"), _name(name)
    {
    }

    const std::string &name() const
    {
        return _name;
    }

  private:
    std::string _name;
};

class NotFoundError : public GeomarkError
{
  public:
    explicit NotFoundError(const std::string &name) : GeomarkError("Point '" + name + "' not found"), _name(name)
    {
    }

    const std::string &name() const
    {
        return _name;
    }

  private:
    std::string _name;
};

class MalformedArchiveError : public GeomarkError
{
  public:
    using GeomarkError::GeomarkError;
};

class MalformedMarkupError : public GeomarkError
{
  public:
    using GeomarkError::GeomarkError;
};

class MissingMarkupError : public GeomarkError
{
  public:
    using GeomarkError::GeomarkError;
};

class FileAccessError : public GeomarkError
{
  public:
    using GeomarkError::GeomarkError;
};

class NoDocumentError : public GeomarkError
{
  public:
    NoDocumentError() : GeomarkError("No KMZ loaded or created, use create or open <path> first")
    {
    }
};

} // namespace geomark
