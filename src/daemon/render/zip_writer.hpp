#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include <zlib.h>

// Builds a zip archive in memory with stored (uncompressed) entries. All
// entries carry the same fixed timestamp so equal input gives equal bytes.
namespace zip {

struct Entry {
    std::string name;
    std::string data;
};

inline std::vector<uint8_t> write(const std::vector<Entry>& entries) {
    constexpr uint16_t version = 20;
    constexpr uint16_t dos_time = 0;
    constexpr uint16_t dos_date = (0 << 9) | (1 << 5) | 1; // 1980-01-01

    std::vector<uint8_t> out;
    auto w = [&out](const void* data, size_t len) {
        auto* p = static_cast<const uint8_t*>(data);
        out.insert(out.end(), p, p + len);
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    struct Record {
        uint32_t crc;
        uint32_t size;
        uint32_t offset;
    };
    std::vector<Record> records;
    records.reserve(entries.size());

    for (auto& e : entries) {
        uint32_t crc = static_cast<uint32_t>(
            ::crc32(0L, reinterpret_cast<const Bytef*>(e.data.data()),
                    static_cast<uInt>(e.data.size())));
        uint32_t size = static_cast<uint32_t>(e.data.size());
        records.push_back({crc, size, static_cast<uint32_t>(out.size())});

        w32(0x04034b50);        // local file header
        w16(version);
        w16(0);                 // flags
        w16(0);                 // stored
        w16(dos_time);
        w16(dos_date);
        w32(crc);
        w32(size);              // compressed
        w32(size);              // uncompressed
        w16(static_cast<uint16_t>(e.name.size()));
        w16(0);                 // extra length
        w(e.name.data(), e.name.size());
        w(e.data.data(), e.data.size());
    }

    uint32_t cd_offset = static_cast<uint32_t>(out.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        auto& e = entries[i];
        auto& r = records[i];
        w32(0x02014b50);        // central directory header
        w16(version);           // made by
        w16(version);           // needed
        w16(0);
        w16(0);
        w16(dos_time);
        w16(dos_date);
        w32(r.crc);
        w32(r.size);
        w32(r.size);
        w16(static_cast<uint16_t>(e.name.size()));
        w16(0);                 // extra
        w16(0);                 // comment
        w16(0);                 // disk
        w16(0);                 // internal attrs
        w32(0);                 // external attrs
        w32(r.offset);
        w(e.name.data(), e.name.size());
    }
    uint32_t cd_size = static_cast<uint32_t>(out.size()) - cd_offset;

    w32(0x06054b50);            // end of central directory
    w16(0);
    w16(0);
    w16(static_cast<uint16_t>(entries.size()));
    w16(static_cast<uint16_t>(entries.size()));
    w32(cd_size);
    w32(cd_offset);
    w16(0);

    return out;
}

} // namespace zip
