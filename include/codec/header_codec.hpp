#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "format/rgb0_format.hpp"
#include "io/byte_stream.hpp"

namespace rgb0 {

// header_end_offset = 23 + port_count*13 + 512 - 1.
// Throws InvalidParameter if the result does not fit in 16 bits.
uint16_t compute_header_end_offset(size_t port_count);

// Decode the fixed 23-byte prefix (ports and gamma_lut are left empty).
// Throws TruncatedHeader (size < 23) or MalformedHeader (magic != "RGB0").
Header decode_header(const uint8_t* data, size_t size);
inline Header decode_header(const std::vector<uint8_t>& bytes) {
    return decode_header(bytes.data(), bytes.size());
}

// Emit the fixed 23-byte prefix with magic "RGB0", version "1001",
// sentinel 0xFFFFFFFF and channel_count 1.
void write_header(ByteWriter& w, uint32_t frame_size, uint16_t frame_count, uint16_t port_count);
// Same, from a header built by build_header.
void write_header(ByteWriter& w, const Header& hdr);

// Build an in-memory header with every derived field filled in.
// frame_size is computed from the ports.
Header build_header(uint16_t frame_count, std::vector<PortDescriptor> ports, const GammaTable& gamma);

} // namespace rgb0
