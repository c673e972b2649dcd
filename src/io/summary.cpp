#include "io/summary.hpp"

#include "layout/frame_layout.hpp"

#include <algorithm>
#include <cstdio>
#include <ostream>

namespace rgb0 {

namespace {

std::string hex_bytes(const uint8_t* data, size_t n) {
    std::string out;
    out.reserve(n * 2);
    char tmp[3];
    for (size_t i = 0; i < n; ++i) {
        std::snprintf(tmp, sizeof(tmp), "%02x", data[i]);
        out += tmp;
    }
    return out;
}

} // namespace

void print_summary(std::ostream& os, const std::string& name, const RgbFile& file) {
    const Header& hdr = file.header;
    os << name << ": frame_size=" << hdr.frame_size << " bytes, frames=" << file.frames.size();
    if (hdr.frame_count != 0) os << " (header claims " << hdr.frame_count << ")";
    os << "\n";

    os << "  gamma sample: [";
    for (size_t i = 0; i < 4; ++i) {
        if (i) os << ", ";
        os << hdr.gamma_lut[i];
    }
    os << "]\n";

    const auto slices = compute_port_offsets(hdr.ports);
    char line[160];
    for (size_t i = 0; i < hdr.ports.size(); ++i) {
        const PortDescriptor& p = hdr.ports[i];
        std::snprintf(line, sizeof(line),
                      "    Port %u: len=%u, mode=0x%02x, flags=0x%04x, loop=%s, offset=%zu\n",
                      static_cast<unsigned>(p.index), static_cast<unsigned>(p.length),
                      static_cast<unsigned>(p.mode), static_cast<unsigned>(p.flags),
                      p.loop_flag ? "true" : "false", slices[i].offset);
        os << line;
    }

    if (!file.frames.empty()) {
        const Frame& first = file.frames.front();
        const size_t n = std::min<size_t>(16, first.size());
        os << "  first frame preview (16 bytes): " << hex_bytes(first.data(), n) << "\n";
    }
}

} // namespace rgb0
