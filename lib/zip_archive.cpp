#include "geosite123/zip_archive.hpp"
#include "geosite123/errors.hpp"
#include <geocore/diag.hpp>
#include <geocore/strutils.hpp>
#include <zlib.h>
#include <algorithm>
#include <climits>
#include <cstring>

using namespace geocore;

static auto _zip = diag_name("zip");

namespace {
const uint32_t EOCD_SIG = 0x06054b50;
const uint32_t ZIP64_LOCATOR_SIG = 0x07064b50;
const uint32_t ZIP64_EOCD_SIG = 0x06064b50;
const uint32_t CDIR_SIG = 0x02014b50;
const uint32_t LOCAL_SIG = 0x04034b50;
const size_t EOCD_SIZE = 22;
const size_t ZIP64_LOCATOR_SIZE = 20;
const size_t CDIR_SIZE = 46;
const size_t LOCAL_SIZE = 30;

// Little-endian readers that refuse to run off the end of the buffer.
struct lecursor{
    const std::string& b;
    size_t pos;
    lecursor(const std::string& b_, size_t pos_) : b(b_), pos(pos_){}
    void need(size_t n) const{
        if(pos > b.size() || b.size() - pos < n)
            throw geosite123::format_error(fmt("zip: truncated at offset %zu, need %zu more bytes", pos, n));
    }
    uint64_t le(size_t n){
        need(n);
        uint64_t ret = 0;
        for(size_t i=0; i<n; ++i)
            ret |= uint64_t(static_cast<unsigned char>(b[pos+i])) << (8*i);
        pos += n;
        return ret;
    }
    uint16_t u16(){ return static_cast<uint16_t>(le(2)); }
    uint32_t u32(){ return static_cast<uint32_t>(le(4)); }
    uint64_t u64(){ return le(8); }
    std::string str(size_t n){
        need(n);
        std::string ret = b.substr(pos, n);
        pos += n;
        return ret;
    }
    void skip(size_t n){ need(n); pos += n; }
};

std::string inflate_raw(const char* p, size_t n, uint64_t expected){
    z_stream zs;
    ::memset(&zs, 0, sizeof(zs));
    // negative window bits: raw deflate, no zlib header
    if(inflateInit2(&zs, -MAX_WBITS) != Z_OK)
        throw geosite123::format_error("zip: inflateInit2 failed");
    std::string out;
    // One spare byte: zlib won't take a null next_out, and a member
    // that inflates to more than expected shows up as a size mismatch.
    out.resize(expected + 1);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(p));
    zs.avail_in = static_cast<uInt>(n);
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(expected + 1);
    int ret = inflate(&zs, Z_FINISH);
    auto produced = zs.total_out;
    std::string msg = zs.msg ? zs.msg : "no message";
    inflateEnd(&zs);
    if(ret != Z_STREAM_END)
        throw geosite123::format_error(fmt("zip: inflate returned %d (%s)", ret, msg.c_str()));
    if(produced != expected)
        throw geosite123::format_error(fmt("zip: inflated %lu bytes, expected %lu",
                                           (unsigned long)produced, (unsigned long)expected));
    out.resize(produced);
    return out;
}
} // namespace <anon>

namespace geosite123{

zip_archive::zip_archive(std::string bytes) try :
    bytes_(std::move(bytes))
{
    read_central_directory();
}catch(format_error&){
    throw;
}catch(std::exception&){
    std::throw_with_nested(format_error("zip_archive: unreadable archive"));
}

void zip_archive::read_central_directory(){
    if(bytes_.size() < EOCD_SIZE)
        throw format_error(fmt("zip: %zu bytes is too short to be an archive", bytes_.size()));
    // The end-of-central-directory record is followed by a comment
    // of at most 64k, so search backwards from the end for its signature.
    size_t lowest = bytes_.size() > EOCD_SIZE + 0xffff ? bytes_.size() - EOCD_SIZE - 0xffff : 0;
    size_t eocd = std::string::npos;
    for(size_t i = bytes_.size() - EOCD_SIZE + 1; i-- > lowest; ){
        if(lecursor(bytes_, i).u32() == EOCD_SIG){
            eocd = i;
            break;
        }
    }
    if(eocd == std::string::npos)
        throw format_error("zip: no end of central directory record");

    lecursor ec(bytes_, eocd+4);
    uint16_t disk = ec.u16();
    uint16_t cd_disk = ec.u16();
    ec.u16(); // entries on this disk
    uint64_t nentries = ec.u16();
    uint64_t cd_size = ec.u32();
    uint64_t cd_offset = ec.u32();
    if(disk != 0 || cd_disk != 0)
        throw format_error("zip: multi-disk archives are not supported");

    if((nentries == 0xffff || cd_size == 0xffffffff || cd_offset == 0xffffffff) && eocd >= ZIP64_LOCATOR_SIZE){
        lecursor loc(bytes_, eocd - ZIP64_LOCATOR_SIZE);
        if(loc.u32() == ZIP64_LOCATOR_SIG){
            loc.u32(); // disk with zip64 eocd
            uint64_t z64off = loc.u64();
            lecursor z(bytes_, z64off);
            if(z.u32() != ZIP64_EOCD_SIG)
                throw format_error("zip: bad zip64 end of central directory signature");
            z.skip(8 + 2 + 2 + 4 + 4 + 8); // size, versions, disk numbers, entries on this disk
            nentries = z.u64();
            cd_size = z.u64();
            cd_offset = z.u64();
            DIAG(_zip, "zip64: " << nentries << " entries");
        }
    }
    if(cd_offset > bytes_.size() || cd_size > bytes_.size() - cd_offset)
        throw format_error(fmt("zip: central directory [%lu, +%lu) lies outside the %zu byte archive",
                               (unsigned long)cd_offset, (unsigned long)cd_size, bytes_.size()));

    entries_.clear();
    byname_.clear();
    entries_.reserve(nentries);
    lecursor c(bytes_, cd_offset);
    for(uint64_t i=0; i<nentries; ++i){
        if(c.u32() != CDIR_SIG)
            throw format_error(fmt("zip: bad central directory signature for entry %lu", (unsigned long)i));
        entry e;
        c.u16(); // version made by
        c.u16(); // version needed
        e.flags = c.u16();
        e.method = c.u16();
        c.u16(); // mtime
        c.u16(); // mdate
        e.crc = c.u32();
        e.compressed_size = c.u32();
        e.uncompressed_size = c.u32();
        uint16_t namelen = c.u16();
        uint16_t extralen = c.u16();
        uint16_t commentlen = c.u16();
        c.u16(); // disk number start
        c.u16(); // internal attributes
        c.u32(); // external attributes
        e.local_header_offset = c.u32();
        e.name = c.str(namelen);
        size_t extra_end = c.pos + extralen;
        c.need(extralen);
        while(c.pos + 4 <= extra_end){
            uint16_t id = c.u16();
            uint16_t len = c.u16();
            size_t field_end = c.pos + len;
            if(field_end > extra_end)
                throw format_error("zip: extra field overruns its entry: " + e.name);
            if(id == 0x0001){
                // zip64: only the fields that overflowed are present, in this order
                if(e.uncompressed_size == 0xffffffff && c.pos + 8 <= field_end)
                    e.uncompressed_size = c.u64();
                if(e.compressed_size == 0xffffffff && c.pos + 8 <= field_end)
                    e.compressed_size = c.u64();
                if(e.local_header_offset == 0xffffffff && c.pos + 8 <= field_end)
                    e.local_header_offset = c.u64();
            }
            c.pos = field_end;
        }
        c.pos = extra_end;
        c.skip(commentlen);
        byname_.emplace(e.name, entries_.size());
        entries_.push_back(std::move(e));
    }
    DIAGf(_zip, "central directory: %zu entries in %zu bytes", entries_.size(), bytes_.size());
}

const zip_archive::entry* zip_archive::find(const std::string& name) const{
    auto p = byname_.find(name);
    if(p == byname_.end())
        return nullptr;
    return &entries_[p->second];
}

std::string zip_archive::read(const std::string& name) const{
    auto e = find(name);
    if(!e)
        throw not_found_error("zip: no member named " + name);
    return read(*e);
}

std::string zip_archive::read(const entry& e) const try {
    if(e.flags & 0x1)
        throw format_error("zip: encrypted members are not supported");
    lecursor lc(bytes_, e.local_header_offset);
    if(lc.u32() != LOCAL_SIG)
        throw format_error("zip: bad local header signature");
    lc.skip(LOCAL_SIZE - 4 - 4);
    uint16_t namelen = lc.u16();
    uint16_t extralen = lc.u16();
    lc.skip(namelen + size_t(extralen));
    lc.need(e.compressed_size);
    const char* data = bytes_.data() + lc.pos;
    std::string out;
    switch(e.method){
    case 0:
        if(e.compressed_size != e.uncompressed_size)
            throw format_error("zip: stored member with compressed size != uncompressed size");
        out.assign(data, e.compressed_size);
        break;
    case 8:
        if(e.compressed_size > UINT_MAX || e.uncompressed_size >= UINT_MAX)
            throw format_error("zip: member too large to inflate in one piece");
        out = inflate_raw(data, e.compressed_size, e.uncompressed_size);
        break;
    default:
        throw format_error(fmt("zip: unsupported compression method %u", unsigned(e.method)));
    }
    auto crc = crc32(0L, Z_NULL, 0);
    // crc32 takes a uInt length, so feed it in pieces.
    for(size_t off = 0; off < out.size(); ){
        uInt chunk = uInt(std::min<size_t>(out.size() - off, 1u<<30));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(out.data() + off), chunk);
        off += chunk;
    }
    if(crc != e.crc)
        throw format_error(fmt("zip: crc mismatch: computed %08lx, directory says %08lx",
                               (unsigned long)crc, (unsigned long)e.crc));
    DIAGf(_zip>1, "read %s: %zu bytes", e.name.c_str(), out.size());
    return out;
}catch(format_error&){
    std::throw_with_nested(format_error("zip_archive::read(" + e.name + ")"));
}

} // namespace geosite123
