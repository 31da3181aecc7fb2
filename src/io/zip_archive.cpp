#include <geomark/io/zip_archive.hpp>

#include <geomark/types/errors.hpp>

#include <spdlog/spdlog.h>

#include <zlib.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace
{

constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_DIRECTORY_SIGNATURE = 0x06054b50;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_DIRECTORY_SIZE = 22;
constexpr uint16_t VERSION_NEEDED = 20;
constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
constexpr uint16_t FLAG_UTF8 = 0x0800;
constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;
constexpr size_t MAX_DEFLATE_RATIO = 1032;
constexpr size_t INFLATE_CHUNK_SIZE = 64 * 1024;

void put16(std::string &out, uint16_t v)
{
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put32(std::string &out, uint32_t v)
{
    put16(out, static_cast<uint16_t>(v & 0xffff));
    put16(out, static_cast<uint16_t>(v >> 16));
}

uint16_t get16(const std::string &in, size_t pos)
{
    return static_cast<uint16_t>(static_cast<uint8_t>(in[pos]) | (static_cast<uint8_t>(in[pos + 1]) << 8));
}

uint32_t get32(const std::string &in, size_t pos)
{
    return static_cast<uint32_t>(get16(in, pos)) | (static_cast<uint32_t>(get16(in, pos + 2)) << 16);
}

uint32_t crc(const std::string &data)
{
    return static_cast<uint32_t>(
        crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(data.size())));
}

// RAII owners so the zlib state is released on every path, including exceptions
struct deflate_stream
{
    z_stream strm{};
    bool initialized = false;

    explicit deflate_stream(int level)
    {
        initialized = deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK;
    }
    ~deflate_stream()
    {
        if (initialized)
            deflateEnd(&strm);
    }
};

struct inflate_stream
{
    z_stream strm{};
    bool initialized = false;

    inflate_stream()
    {
        initialized = inflateInit2(&strm, -MAX_WBITS) == Z_OK;
    }
    ~inflate_stream()
    {
        if (initialized)
            inflateEnd(&strm);
    }
};

std::string deflateRaw(const std::string &data, int level)
{
    deflate_stream d(level);
    if (!d.initialized)
    {
        throw std::runtime_error("zlib deflateInit2 failed");
    }

    std::string out;
    out.resize(deflateBound(&d.strm, static_cast<uLong>(data.size())));
    d.strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    d.strm.avail_in = static_cast<uInt>(data.size());
    d.strm.next_out = reinterpret_cast<Bytef *>(&out[0]);
    d.strm.avail_out = static_cast<uInt>(out.size());

    if (deflate(&d.strm, Z_FINISH) != Z_STREAM_END)
    {
        throw std::runtime_error("zlib deflate did not complete");
    }
    out.resize(d.strm.total_out);
    return out;
}

std::string inflateRaw(const std::string &compressed, size_t expected_size, const std::string &name)
{
    // deflate cannot expand data by more than 1032:1, so a larger claim is corrupt
    if (expected_size > compressed.size() * MAX_DEFLATE_RATIO)
    {
        throw geomark::MalformedArchiveError("Zip entry '" + name + "' claims " + std::to_string(expected_size) +
                                             " bytes from " + std::to_string(compressed.size()) + " compressed");
    }

    inflate_stream s;
    if (!s.initialized)
    {
        throw std::runtime_error("zlib inflateInit2 failed");
    }

    s.strm.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
    s.strm.avail_in = static_cast<uInt>(compressed.size());

    std::string out;
    std::array<char, INFLATE_CHUNK_SIZE> chunk;
    int ret = Z_OK;
    while (ret != Z_STREAM_END)
    {
        s.strm.next_out = reinterpret_cast<Bytef *>(chunk.data());
        s.strm.avail_out = static_cast<uInt>(chunk.size());
        ret = inflate(&s.strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END)
        {
            throw geomark::MalformedArchiveError("Corrupt deflate data in zip entry '" + name + "'");
        }
        const size_t produced = chunk.size() - s.strm.avail_out;
        if (out.size() + produced > expected_size)
        {
            throw geomark::MalformedArchiveError("Zip entry '" + name + "' inflates past its declared size");
        }
        out.append(chunk.data(), produced);
    }
    if (out.size() != expected_size)
    {
        throw geomark::MalformedArchiveError("Corrupt deflate data in zip entry '" + name + "'");
    }
    return out;
}

void dosTimestamp(uint16_t &time, uint16_t &date)
{
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    time = static_cast<uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
    date = static_cast<uint16_t>(((std::max(local.tm_year, 80) - 80) << 9) | ((local.tm_mon + 1) << 5) |
                                 local.tm_mday);
}

} // namespace

namespace geomark
{

std::string writeZip(const std::vector<zip_entry> &entries, int compression_level)
{
    uint16_t mod_time = 0, mod_date = 0;
    dosTimestamp(mod_time, mod_date);

    std::string archive;
    std::string directory;
    for (const auto &entry : entries)
    {
        const uint16_t method = compression_level == 0 ? METHOD_STORED : METHOD_DEFLATED;
        const std::string payload = method == METHOD_STORED ? entry.data : deflateRaw(entry.data, compression_level);
        const uint32_t checksum = crc(entry.data);
        const uint32_t offset = static_cast<uint32_t>(archive.size());

        put32(archive, LOCAL_HEADER_SIGNATURE);
        put16(archive, VERSION_NEEDED);
        put16(archive, FLAG_UTF8);
        put16(archive, method);
        put16(archive, mod_time);
        put16(archive, mod_date);
        put32(archive, checksum);
        put32(archive, static_cast<uint32_t>(payload.size()));
        put32(archive, static_cast<uint32_t>(entry.data.size()));
        put16(archive, static_cast<uint16_t>(entry.name.size()));
        put16(archive, 0);
        archive += entry.name;
        archive += payload;

        put32(directory, CENTRAL_HEADER_SIGNATURE);
        put16(directory, VERSION_NEEDED);
        put16(directory, VERSION_NEEDED);
        put16(directory, FLAG_UTF8);
        put16(directory, method);
        put16(directory, mod_time);
        put16(directory, mod_date);
        put32(directory, checksum);
        put32(directory, static_cast<uint32_t>(payload.size()));
        put32(directory, static_cast<uint32_t>(entry.data.size()));
        put16(directory, static_cast<uint16_t>(entry.name.size()));
        put16(directory, 0); // extra
        put16(directory, 0); // comment
        put16(directory, 0); // disk
        put16(directory, 0); // internal attributes
        put32(directory, 0); // external attributes
        put32(directory, offset);
        directory += entry.name;

        spdlog::debug("zip entry {}: {} bytes, {} compressed", entry.name, entry.data.size(), payload.size());
    }

    const uint32_t directory_offset = static_cast<uint32_t>(archive.size());
    archive += directory;

    put32(archive, END_OF_DIRECTORY_SIGNATURE);
    put16(archive, 0);
    put16(archive, 0);
    put16(archive, static_cast<uint16_t>(entries.size()));
    put16(archive, static_cast<uint16_t>(entries.size()));
    put32(archive, static_cast<uint32_t>(directory.size()));
    put32(archive, directory_offset);
    put16(archive, 0);

    return archive;
}

ZipReader::ZipReader(std::string bytes) : _bytes(std::move(bytes))
{
    parseCentralDirectory();
}

void ZipReader::parseCentralDirectory()
{
    if (_bytes.size() < END_OF_DIRECTORY_SIZE)
    {
        throw MalformedArchiveError("Not a zip archive: too short");
    }

    // the end of central directory record may be followed by a comment of up to 64k
    const size_t last = _bytes.size() - END_OF_DIRECTORY_SIZE;
    const size_t first = last > 0xffff ? last - 0xffff : 0;
    size_t eocd = std::string::npos;
    for (size_t pos = last + 1; pos-- > first;)
    {
        if (get32(_bytes, pos) == END_OF_DIRECTORY_SIGNATURE)
        {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos)
    {
        throw MalformedArchiveError("Not a zip archive: no end of central directory record");
    }

    const uint16_t entry_count = get16(_bytes, eocd + 10);
    const uint32_t directory_size = get32(_bytes, eocd + 12);
    const uint32_t directory_offset = get32(_bytes, eocd + 16);
    if (directory_offset == 0xffffffff || entry_count == 0xffff)
    {
        throw MalformedArchiveError("Zip64 archives are not supported");
    }
    if (static_cast<size_t>(directory_offset) + directory_size > eocd)
    {
        throw MalformedArchiveError("Truncated zip central directory");
    }

    size_t pos = directory_offset;
    _records.reserve(entry_count);
    for (uint16_t i = 0; i < entry_count; i++)
    {
        if (pos + CENTRAL_HEADER_SIZE > eocd || get32(_bytes, pos) != CENTRAL_HEADER_SIGNATURE)
        {
            throw MalformedArchiveError("Corrupt zip central directory entry " + std::to_string(i));
        }

        directory_record r;
        r.flags = get16(_bytes, pos + 8);
        r.method = get16(_bytes, pos + 10);
        r.crc = get32(_bytes, pos + 16);
        r.compressed_size = get32(_bytes, pos + 20);
        r.uncompressed_size = get32(_bytes, pos + 24);
        const uint16_t name_length = get16(_bytes, pos + 28);
        const uint16_t extra_length = get16(_bytes, pos + 30);
        const uint16_t comment_length = get16(_bytes, pos + 32);
        r.local_header_offset = get32(_bytes, pos + 42);

        if (pos + CENTRAL_HEADER_SIZE + name_length > eocd)
        {
            throw MalformedArchiveError("Corrupt zip central directory entry " + std::to_string(i));
        }
        r.name = _bytes.substr(pos + CENTRAL_HEADER_SIZE, name_length);
        _records.push_back(std::move(r));

        pos += CENTRAL_HEADER_SIZE + name_length + extra_length + comment_length;
    }

    spdlog::debug("zip archive of {} bytes with {} entries", _bytes.size(), _records.size());
}

std::vector<std::string> ZipReader::entryNames() const
{
    std::vector<std::string> names;
    names.reserve(_records.size());
    for (const auto &r : _records)
    {
        names.push_back(r.name);
    }
    return names;
}

bool ZipReader::contains(const std::string &name) const
{
    return std::any_of(_records.begin(), _records.end(), [&name](const directory_record &r) { return r.name == name; });
}

const ZipReader::directory_record &ZipReader::record(const std::string &name) const
{
    auto iter =
        std::find_if(_records.begin(), _records.end(), [&name](const directory_record &r) { return r.name == name; });
    if (iter == _records.end())
    {
        throw std::out_of_range("No zip entry named '" + name + "'");
    }
    return *iter;
}

std::string ZipReader::read(const std::string &name) const
{
    const directory_record &r = record(name);

    if (r.flags & FLAG_ENCRYPTED)
    {
        throw MalformedArchiveError("Encrypted zip entry '" + name + "' is not supported");
    }

    const size_t header = r.local_header_offset;
    if (header + LOCAL_HEADER_SIZE > _bytes.size() || get32(_bytes, header) != LOCAL_HEADER_SIGNATURE)
    {
        throw MalformedArchiveError("Corrupt local header for zip entry '" + name + "'");
    }
    const size_t data_offset = header + LOCAL_HEADER_SIZE + get16(_bytes, header + 26) + get16(_bytes, header + 28);
    if (data_offset + r.compressed_size > _bytes.size())
    {
        throw MalformedArchiveError("Truncated data for zip entry '" + name + "'");
    }
    const std::string payload = _bytes.substr(data_offset, r.compressed_size);

    std::string data;
    switch (r.method)
    {
    case METHOD_STORED:
        data = payload;
        break;
    case METHOD_DEFLATED:
        data = inflateRaw(payload, r.uncompressed_size, name);
        break;
    default:
        throw MalformedArchiveError("Unsupported compression method " + std::to_string(r.method) + " for zip entry '" +
                                    name + "'");
    }

    if (data.size() != r.uncompressed_size || crc(data) != r.crc)
    {
        throw MalformedArchiveError("CRC mismatch in zip entry '" + name + "'");
    }
    return data;
}

} // namespace geomark
