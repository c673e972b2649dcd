#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <vector>

#include "format/rgb0_format.hpp"

namespace rgb0 {

struct ReadOptions {
    // Stop after this many frames. Overrides the header's frame_count when set.
    std::optional<size_t> max_frames;
};

// Decode header, port table and gamma table, then frames until frame_count
// (or end of input when frame_count == 0). A trailing partial frame is dropped.
// Throws MalformedHeader, TruncatedHeader, TruncatedPortTable,
// TruncatedGammaTable or InconsistentLayout before any frame is read.
RgbFile read_rgb0(std::istream& is, const ReadOptions& opt = {});

// In-memory variant of read_rgb0 (no copy of the buffer is made).
RgbFile decode_rgb0(const std::vector<uint8_t>& bytes, const ReadOptions& opt = {});

} // namespace rgb0
