#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "format/rgb0_format.hpp"
#include "io/byte_stream.hpp"

namespace rgb0 {

// 256 big-endian u16 values. Throws TruncatedGammaTable if size < 512.
GammaTable decode_gamma_table(const uint8_t* data, size_t size);

// 0, 1, 2, ..., 255
GammaTable identity_gamma();

// Identity when values is empty; InvalidGammaTable unless exactly 256 entries.
GammaTable make_gamma_table(const std::optional<std::vector<uint16_t>>& values);

void write_gamma_table(ByteWriter& w, const GammaTable& lut);

} // namespace rgb0
