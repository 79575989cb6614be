#pragma once

// zipmaker - assemble small zip archives in memory for the unit
// tests.  Members are stored or raw-deflated with zlib.
//
//    zipmaker zm;
//    zm.add("data/google", "domain:google.com\n");
//    zm.add("data/big", text, true);   // deflated
//    std::string bytes = zm.finish();

#include <zlib.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class zipmaker{
public:
    void add(const std::string& name, const std::string& data, bool deflate = false){
        member m;
        m.name = name;
        m.method = deflate ? 8 : 0;
        m.crc = crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(data.data()), uInt(data.size()));
        m.usize = uint32_t(data.size());
        std::string payload = deflate ? raw_deflate(data) : data;
        m.csize = uint32_t(payload.size());
        m.offset = uint32_t(out.size());
        put32(out, 0x04034b50);
        put16(out, 20);
        put16(out, 0);
        put16(out, m.method);
        put16(out, 0);
        put16(out, 0);
        put32(out, m.crc);
        put32(out, m.csize);
        put32(out, m.usize);
        put16(out, uint16_t(name.size()));
        put16(out, 0);
        out += name;
        out += payload;
        members.push_back(m);
    }

    std::string finish(){
        std::string ret = out;
        auto cd_offset = uint32_t(ret.size());
        for(auto& m : members){
            put32(ret, 0x02014b50);
            put16(ret, 20);
            put16(ret, 20);
            put16(ret, 0);
            put16(ret, m.method);
            put16(ret, 0);
            put16(ret, 0);
            put32(ret, m.crc);
            put32(ret, m.csize);
            put32(ret, m.usize);
            put16(ret, uint16_t(m.name.size()));
            put16(ret, 0);
            put16(ret, 0);
            put16(ret, 0);
            put16(ret, 0);
            put32(ret, 0);
            put32(ret, m.offset);
            ret += m.name;
        }
        auto cd_size = uint32_t(ret.size() - cd_offset);
        put32(ret, 0x06054b50);
        put16(ret, 0);
        put16(ret, 0);
        put16(ret, uint16_t(members.size()));
        put16(ret, uint16_t(members.size()));
        put32(ret, cd_size);
        put32(ret, cd_offset);
        put16(ret, 0);
        return ret;
    }

private:
    struct member{
        std::string name;
        uint16_t method;
        uint32_t crc, csize, usize, offset;
    };
    std::string out;
    std::vector<member> members;

    static void put16(std::string& s, uint16_t v){
        s.push_back(char(v & 0xff));
        s.push_back(char(v >> 8));
    }
    static void put32(std::string& s, uint32_t v){
        put16(s, uint16_t(v & 0xffff));
        put16(s, uint16_t(v >> 16));
    }
    static std::string raw_deflate(const std::string& data){
        z_stream zs{};
        if(deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK)
            throw std::runtime_error("deflateInit2 failed");
        std::string ret(deflateBound(&zs, uLong(data.size())), '\0');
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        zs.avail_in = uInt(data.size());
        zs.next_out = reinterpret_cast<Bytef*>(&ret[0]);
        zs.avail_out = uInt(ret.size());
        auto rc = deflate(&zs, Z_FINISH);
        deflateEnd(&zs);
        if(rc != Z_STREAM_END)
            throw std::runtime_error("deflate did not finish");
        ret.resize(zs.total_out);
        return ret;
    }
};
