#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rgb0 {

// IMPORTANT:
// Do NOT write/read these structs by dumping raw memory or using sizeof().
// Struct padding/alignment is compiler-dependent. Always serialize field-by-field.
inline constexpr size_t kHeaderBytes = 0x17;        // fixed on-disk header prefix
inline constexpr size_t kPortEntryBytes = 0x0D;     // one port descriptor
inline constexpr size_t kGammaEntries = 256;
inline constexpr size_t kGammaBytes = kGammaEntries * 2;

inline constexpr char kMagic[4] = {'R', 'G', 'B', '0'};
inline constexpr char kVersion[4] = {'1', '0', '0', '1'};
inline constexpr uint32_t kSentinel = 0xFFFFFFFFu;
inline constexpr uint8_t kChannelCount = 1;
inline constexpr uint8_t kLoopFlagMask = 0x80;

// Observed mode bytes. Passed through as-is, never interpreted by the codec.
inline constexpr uint8_t kModeDmx512 = 0x03;
inline constexpr uint8_t kModeSpiTtl = 0x06;
inline constexpr uint8_t kModeTm1814 = 0x1B;

// .rgb file layout:
// [Header 23][Port table 13 * port_count][Gamma 512][Frames frame_size * frame_count]
//
// All multi-byte fields are big-endian.
struct PortDescriptor {
    uint16_t index = 0;       // port id, unique within a file
    uint16_t length = 0;      // bytes contributed to every frame
    uint8_t  mode = 0;        // output protocol tag
    uint16_t flags = 0;       // opaque
    uint8_t  loop_byte = 0;   // raw control byte
    bool     loop_flag = false; // bit 7 of loop_byte
};

using GammaTable = std::array<uint16_t, kGammaEntries>;

struct Header {
    char     magic[4] = {0, 0, 0, 0};
    char     version[4] = {0, 0, 0, 0};
    uint32_t sentinel = 0;
    uint16_t header_end_offset = 0;   // last header/gamma byte, frames start at +1
    uint16_t frame_count = 0;         // 0 = unknown, read until end of input
    uint32_t frame_size = 0;          // == sum of ports[i].length
    uint16_t port_count = 0;
    uint8_t  channel_count = 0;       // always 1 in observed captures

    std::vector<PortDescriptor> ports; // order defines the frame layout
    GammaTable gamma_lut{};

    std::string magic_str() const { return std::string(magic, 4); }
    std::string version_str() const { return std::string(version, 4); }
};

// One frame: frame_size raw bytes, port blocks in table order.
using Frame = std::vector<uint8_t>;

struct RgbFile {
    Header header;
    std::vector<Frame> frames;
};

// One LED on the write path.
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

using PortPixels = std::vector<Rgb>;
using FramePixels = std::vector<PortPixels>; // one entry per port

} // namespace rgb0
