#include "codec/reader.hpp"

#include "codec/gamma_table.hpp"
#include "codec/header_codec.hpp"
#include "codec/port_table.hpp"
#include "format/errors.hpp"
#include "layout/frame_layout.hpp"

#include <algorithm>
#include <cstdio>
#include <istream>
#include <streambuf>

namespace rgb0 {

namespace {

// Read-only streambuf over an existing buffer.
class MemoryBuf : public std::streambuf {
public:
    MemoryBuf(const uint8_t* data, size_t size) {
        char* p = const_cast<char*>(reinterpret_cast<const char*>(data));
        setg(p, p, p + size);
    }
};

static size_t read_up_to(std::istream& is, uint8_t* dst, size_t n) {
    if (n == 0) return 0;
    is.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    return static_cast<size_t>(is.gcount());
}

// Fill one frame, growing the buffer as bytes arrive so a large declared
// frame_size costs nothing until the data actually exists.
// Returns false (frame holds the partial tail) when input ends early.
static bool read_frame(std::istream& is, size_t frame_size, Frame& frame) {
    constexpr size_t kChunkBytes = 64 * 1024;
    frame.clear();
    while (frame.size() < frame_size) {
        const size_t have = frame.size();
        const size_t want = std::min(kChunkBytes, frame_size - have);
        frame.resize(have + want);
        const size_t got = read_up_to(is, frame.data() + have, want);
        frame.resize(have + got);
        if (got < want) return false;
    }
    return true;
}

static std::optional<size_t> frame_limit(const Header& hdr, const ReadOptions& opt) {
    if (opt.max_frames) return opt.max_frames;
    if (hdr.frame_count != 0) return static_cast<size_t>(hdr.frame_count);
    return std::nullopt;
}

} // namespace

RgbFile read_rgb0(std::istream& is, const ReadOptions& opt) {
    //===Header===//
    std::vector<uint8_t> buf(kHeaderBytes);
    size_t got = read_up_to(is, buf.data(), buf.size());
    Header hdr = decode_header(buf.data(), got);

    //===Port table===//
    buf.assign(static_cast<size_t>(hdr.port_count) * kPortEntryBytes, 0);
    got = read_up_to(is, buf.data(), buf.size());
    hdr.ports = decode_port_table(buf.data(), got, hdr.port_count);

    //===Gamma table===//
    buf.assign(kGammaBytes, 0);
    got = read_up_to(is, buf.data(), buf.size());
    hdr.gamma_lut = decode_gamma_table(buf.data(), got);

    //===Layout check===//
    const FrameLayout layout(hdr.ports);
    if (layout.frame_size() != hdr.frame_size) {
        throw InconsistentLayout("header frame_size=" + std::to_string(hdr.frame_size) +
                                 " but ports sum to " + std::to_string(layout.frame_size()));
    }
#ifndef NDEBUG
    std::fprintf(stderr, "rgb0: version=%s ports=%u frame_size=%u frame_count=%u header_end=%u\n",
                 hdr.version_str().c_str(), static_cast<unsigned>(hdr.port_count),
                 static_cast<unsigned>(hdr.frame_size), static_cast<unsigned>(hdr.frame_count),
                 static_cast<unsigned>(hdr.header_end_offset));
#endif

    RgbFile file;
    file.header = std::move(hdr);

    // Nothing to consume per frame: a zero-size layout yields no frames.
    if (file.header.frame_size == 0) return file;

    //===Frames===//
    const std::optional<size_t> limit = frame_limit(file.header, opt);
    if (limit) file.frames.reserve(std::min<size_t>(*limit, 0xFFFF));
    while (!limit || file.frames.size() < *limit) {
        Frame frame;
        if (!read_frame(is, file.header.frame_size, frame)) {
#ifndef NDEBUG
            if (!frame.empty() || (limit && file.frames.size() < *limit)) {
                std::fprintf(stderr, "rgb0: stopped after %zu frames (%zu trailing bytes)\n",
                             file.frames.size(), frame.size());
            }
#endif
            break;
        }
        file.frames.push_back(std::move(frame));
    }
    return file;
}

RgbFile decode_rgb0(const std::vector<uint8_t>& bytes, const ReadOptions& opt) {
    MemoryBuf mb(bytes.data(), bytes.size());
    std::istream is(&mb);
    return read_rgb0(is, opt);
}

} // namespace rgb0
