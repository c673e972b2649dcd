#pragma once

#include "doctest.h"

#include <cstdint>
#include <string>
#include <vector>

#include "format/rgb0_format.hpp"

// Deterministic LED value so any misplaced byte shows up.
inline rgb0::Rgb led_value(size_t frame, size_t port, size_t led) {
    return rgb0::Rgb{static_cast<uint8_t>(frame * 31 + port),
                     static_cast<uint8_t>(port * 7 + led),
                     static_cast<uint8_t>(led * 3 + frame)};
}

inline std::vector<rgb0::FramePixels> make_frames(size_t frames, size_t ports, size_t leds) {
    std::vector<rgb0::FramePixels> out(frames);
    for (size_t f = 0; f < frames; ++f) {
        out[f].resize(ports);
        for (size_t p = 0; p < ports; ++p) {
            for (size_t l = 0; l < leds; ++l) out[f][p].push_back(led_value(f, p, l));
        }
    }
    return out;
}

// Expected raw bytes of one frame: R,G,B per LED, ports in order.
inline std::vector<uint8_t> frame_bytes(const rgb0::FramePixels& frame) {
    std::vector<uint8_t> out;
    for (const auto& port : frame) {
        for (const auto& led : port) {
            out.push_back(led.r);
            out.push_back(led.g);
            out.push_back(led.b);
        }
    }
    return out;
}

inline void put_u16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v >> 8));
    b.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    put_u16(b, static_cast<uint16_t>(v >> 16));
    put_u16(b, static_cast<uint16_t>(v & 0xFFFF));
}

// Hand-assembled capture, independent of the codec under test.
// gamma is identity; frame bytes are appended verbatim.
inline std::vector<uint8_t> raw_capture(const std::vector<rgb0::PortDescriptor>& ports,
                                        uint16_t frame_count,
                                        uint32_t frame_size,
                                        const std::vector<uint8_t>& frame_data,
                                        const char* magic = "RGB0") {
    std::vector<uint8_t> b(magic, magic + 4);
    const char version[] = "1001";
    b.insert(b.end(), version, version + 4);
    put_u32(b, 0xFFFFFFFFu);
    put_u16(b, static_cast<uint16_t>(23 + ports.size() * 13 + 512 - 1));
    put_u16(b, frame_count);
    put_u32(b, frame_size);
    put_u16(b, static_cast<uint16_t>(ports.size()));
    b.push_back(1);
    for (const auto& p : ports) {
        put_u16(b, p.index);
        put_u16(b, p.length);
        put_u32(b, 0);
        b.push_back(p.mode);
        put_u16(b, p.flags);
        b.push_back(p.loop_byte);
        b.push_back(0);
    }
    for (uint16_t i = 0; i < 256; ++i) put_u16(b, i);
    b.insert(b.end(), frame_data.begin(), frame_data.end());
    return b;
}

inline rgb0::PortDescriptor port(uint16_t index, uint16_t length, uint8_t mode = 0x06,
                                 uint16_t flags = 0x80FA, uint8_t loop_byte = 0x50) {
    rgb0::PortDescriptor p;
    p.index = index;
    p.length = length;
    p.mode = mode;
    p.flags = flags;
    p.loop_byte = loop_byte;
    p.loop_flag = (loop_byte & 0x80) != 0;
    return p;
}

// 0, 1, 2, ... wrapping at 256.
inline std::vector<uint8_t> counting_bytes(size_t n, uint8_t start = 0) {
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(start + i);
    return out;
}
