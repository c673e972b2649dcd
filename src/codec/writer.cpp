#include "codec/writer.hpp"

#include "codec/gamma_table.hpp"
#include "codec/header_codec.hpp"
#include "codec/port_table.hpp"
#include "format/errors.hpp"
#include "io/byte_stream.hpp"
#include "layout/frame_layout.hpp"

#include <cstdio>
#include <limits>

namespace rgb0 {

void validate_frames(const std::vector<FramePixels>& frames, size_t port_count, size_t leds_per_port) {
    for (size_t f = 0; f < frames.size(); ++f) {
        const FramePixels& frame = frames[f];
        if (frame.size() != port_count) {
            throw ShapeMismatch(f, -1, port_count, frame.size(), "ports");
        }
        for (size_t p = 0; p < frame.size(); ++p) {
            if (frame[p].size() != leds_per_port) {
                throw ShapeMismatch(f, static_cast<long>(p), leds_per_port, frame[p].size(), "LEDs");
            }
        }
    }
}

std::vector<uint8_t> encode_rgb0(const std::vector<FramePixels>& frames, const WriterConfig& cfg) {
    if (frames.empty()) throw InvalidParameter("encode: frames sequence must not be empty");
    if (cfg.port_count == 0) throw InvalidParameter("encode: port_count must be > 0");
    if (cfg.leds_per_port == 0) throw InvalidParameter("encode: leds_per_port must be > 0");
    if (frames.size() > std::numeric_limits<uint16_t>::max()) {
        throw InvalidParameter("encode: " + std::to_string(frames.size()) +
                               " frames exceed the 16-bit frame_count");
    }
    const size_t bytes_per_port = static_cast<size_t>(cfg.leds_per_port) * 3;
    if (bytes_per_port > std::numeric_limits<uint16_t>::max()) {
        throw InvalidParameter("encode: " + std::to_string(cfg.leds_per_port) +
                               " LEDs per port exceed the 16-bit port length");
    }

    //===Validate===//
    validate_frames(frames, cfg.port_count, cfg.leds_per_port);
    const GammaTable gamma = make_gamma_table(cfg.gamma);

    //===Header===//
    const Header hdr = build_header(static_cast<uint16_t>(frames.size()),
                                    make_uniform_ports(cfg.port_count, static_cast<uint16_t>(bytes_per_port),
                                                       cfg.loop_byte, cfg.mode, cfg.flags),
                                    gamma);
    const FrameLayout layout(hdr.ports);
#ifndef NDEBUG
    std::fprintf(stderr, "rgb0: encoding %u frames, %u ports x %zu bytes (frame_size=%u)\n",
                 static_cast<unsigned>(hdr.frame_count), static_cast<unsigned>(hdr.port_count),
                 bytes_per_port, static_cast<unsigned>(hdr.frame_size));
#endif

    //===Serialize===//
    ByteWriter w;
    w.reserve(static_cast<size_t>(hdr.header_end_offset) + 1 +
              static_cast<size_t>(hdr.frame_size) * frames.size());
    write_header(w, hdr);
    write_port_table(w, hdr.ports);
    write_gamma_table(w, hdr.gamma_lut);
    for (size_t f = 0; f < frames.size(); ++f) {
        layout.assemble_into(w, frames[f], f);
    }

    const size_t expected_size = static_cast<size_t>(hdr.header_end_offset) + 1 +
                                 static_cast<size_t>(hdr.frame_size) * frames.size();
    if (w.size() != expected_size) {
        throw std::runtime_error("encode: buffer size mismatch after serialization");
    }
    return w.take();
}

} // namespace rgb0
