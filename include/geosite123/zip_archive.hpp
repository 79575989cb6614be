#pragma once

// zip_archive - read-only, in-memory view of a zip file.
//
// The constructor takes ownership of the bytes and reads the central
// directory (zip64 included).  Anything it can't make sense of is a
// format_error, so constructing a zip_archive doubles as validation
// of a download.  Members are decompressed on demand by read():
// stored and deflated members are supported, and the crc32 and size
// recorded in the directory are checked.

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace geosite123{

class zip_archive{
public:
    struct entry{
        std::string name;
        uint16_t flags;
        uint16_t method;
        uint32_t crc;
        uint64_t compressed_size;
        uint64_t uncompressed_size;
        uint64_t local_header_offset;
    };

    explicit zip_archive(std::string bytes);

    const std::vector<entry>& entries() const { return entries_; }
    // nullptr if there's no member with that exact name.
    const entry* find(const std::string& name) const;
    std::string read(const entry& e) const;
    // Throws not_found_error if name isn't a member.
    std::string read(const std::string& name) const;

    const std::string& bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }

private:
    std::string bytes_;
    std::vector<entry> entries_;
    std::unordered_map<std::string, size_t> byname_;
    void read_central_directory();
};

} // namespace geosite123
