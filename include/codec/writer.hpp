#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "format/rgb0_format.hpp"

namespace rgb0 {

// Known hardware profile: 16 ports, 1000 RGB LEDs per port.
inline constexpr uint16_t kDefaultPortCount = 16;
inline constexpr uint16_t kDefaultLedsPerPort = 1000;
inline constexpr uint8_t kDefaultLoopByte = 0x50;   // matches working captures
inline constexpr uint16_t kDefaultFlags = 0x80FA;

struct WriterConfig {
    uint16_t port_count = kDefaultPortCount;
    uint16_t leds_per_port = kDefaultLedsPerPort;
    std::optional<std::vector<uint16_t>> gamma;    // identity 0..255 when absent
    uint8_t loop_byte = kDefaultLoopByte;
    uint8_t mode = kModeSpiTtl;
    uint16_t flags = kDefaultFlags;
};

// Every frame must carry port_count ports of leds_per_port LEDs each.
// Throws ShapeMismatch naming the first offending frame (and port).
void validate_frames(const std::vector<FramePixels>& frames, size_t port_count, size_t leds_per_port);

// Serialize header + port table + gamma table + frames.
// Throws InvalidParameter, ShapeMismatch or InvalidGammaTable; nothing is
// emitted on failure.
std::vector<uint8_t> encode_rgb0(const std::vector<FramePixels>& frames, const WriterConfig& cfg = {});

} // namespace rgb0
