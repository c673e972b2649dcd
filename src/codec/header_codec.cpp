#include "codec/header_codec.hpp"

#include "format/errors.hpp"

#include <cstring>
#include <limits>

namespace rgb0 {

uint16_t compute_header_end_offset(size_t port_count) {
    const size_t end = kHeaderBytes + port_count * kPortEntryBytes + kGammaBytes - 1;
    if (end > std::numeric_limits<uint16_t>::max()) {
        throw InvalidParameter("header: " + std::to_string(port_count) +
                               " ports overflow header_end_offset");
    }
    return static_cast<uint16_t>(end);
}

Header decode_header(const uint8_t* data, size_t size) {
    if (size < kHeaderBytes) {
        throw TruncatedHeader("header: need " + std::to_string(kHeaderBytes) +
                              " bytes, got " + std::to_string(size));
    }
    ByteReader r(data, kHeaderBytes);

    Header hdr;
    r.read_bytes(hdr.magic, 4);
    r.read_bytes(hdr.version, 4);
    hdr.sentinel = r.read_u32_be();
    hdr.header_end_offset = r.read_u16_be();
    hdr.frame_count = r.read_u16_be();
    hdr.frame_size = r.read_u32_be();
    hdr.port_count = r.read_u16_be();
    hdr.channel_count = r.read_u8();

    if (std::memcmp(hdr.magic, kMagic, 4) != 0) {
        throw MalformedHeader("header: not an RGB0 capture (magic='" + hdr.magic_str() + "')");
    }
    // version is informational only
    return hdr;
}

void write_header(ByteWriter& w, uint32_t frame_size, uint16_t frame_count, uint16_t port_count) {
    const uint16_t header_end = compute_header_end_offset(port_count);
    w.write_bytes(kMagic, 4);
    w.write_bytes(kVersion, 4);
    w.write_u32_be(kSentinel);
    w.write_u16_be(header_end);
    w.write_u16_be(frame_count);
    w.write_u32_be(frame_size);
    w.write_u16_be(port_count);
    w.write_u8(kChannelCount);
}

void write_header(ByteWriter& w, const Header& hdr) {
    write_header(w, hdr.frame_size, hdr.frame_count, hdr.port_count);
}

Header build_header(uint16_t frame_count, std::vector<PortDescriptor> ports, const GammaTable& gamma) {
    if (ports.size() > std::numeric_limits<uint16_t>::max()) {
        throw InvalidParameter("header: too many ports (" + std::to_string(ports.size()) + ")");
    }
    uint64_t frame_size = 0;
    for (const auto& p : ports) frame_size += p.length;

    Header hdr;
    std::memcpy(hdr.magic, kMagic, 4);
    std::memcpy(hdr.version, kVersion, 4);
    hdr.sentinel = kSentinel;
    hdr.header_end_offset = compute_header_end_offset(ports.size());
    hdr.frame_count = frame_count;
    hdr.frame_size = static_cast<uint32_t>(frame_size);
    hdr.port_count = static_cast<uint16_t>(ports.size());
    hdr.channel_count = kChannelCount;
    hdr.ports = std::move(ports);
    hdr.gamma_lut = gamma;
    return hdr;
}

} // namespace rgb0
