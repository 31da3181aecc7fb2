#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace geomark
{

struct zip_entry
{
    std::string name;
    std::string data;
};

// level 0 stores entries, -1 uses the zlib default
std::string writeZip(const std::vector<zip_entry> &entries, int compression_level = -1);

class ZipReader
{
  public:
    explicit ZipReader(std::string bytes);

    std::vector<std::string> entryNames() const;
    bool contains(const std::string &name) const;

    // throws std::out_of_range for an unknown entry, MalformedArchiveError for corrupt data
    std::string read(const std::string &name) const;

  private:
    struct directory_record
    {
        std::string name;
        uint16_t flags;
        uint16_t method;
        uint32_t crc;
        uint32_t compressed_size;
        uint32_t uncompressed_size;
        uint32_t local_header_offset;
    };

    void parseCentralDirectory();
    const directory_record &record(const std::string &name) const;

    std::string _bytes;
    std::vector<directory_record> _records;
};

} // namespace geomark
