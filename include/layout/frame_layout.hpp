#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "format/rgb0_format.hpp"
#include "io/byte_stream.hpp"

namespace rgb0 {

// Byte range of one port inside a frame.
struct PortSlice {
    uint16_t index = 0;
    size_t offset = 0;
    size_t length = 0;
};

// Offsets in table order: offset(p) = sum of lengths of the ports before p.
std::vector<PortSlice> compute_port_offsets(const std::vector<PortDescriptor>& ports);

// Frame layout for one port table snapshot.
// Headers never change after construction, so a layout built from one stays valid;
// build a new layout for a different table.
class FrameLayout {
public:
    // Throws InconsistentLayout if a port index appears twice.
    explicit FrameLayout(const std::vector<PortDescriptor>& ports);

    size_t frame_size() const { return frame_size_; }
    size_t port_count() const { return slices_.size(); }
    const std::vector<PortSlice>& slices() const { return slices_; }

    // Throws UnknownPort.
    const PortSlice& slice_of(uint16_t port_index) const;
    size_t offset_of(uint16_t port_index) const { return slice_of(port_index).offset; }

    // Copy of bytes [offset, offset+length) for one port.
    // Throws UnknownPort, or InvalidParameter if frame is shorter than frame_size().
    std::vector<uint8_t> extract(const Frame& frame, uint16_t port_index) const;

    // Concatenate R,G,B triplets of every port in table order.
    // Throws ShapeMismatch (frame_index names the offending frame).
    Frame assemble(const FramePixels& pixels, size_t frame_index = 0) const;
    void assemble_into(ByteWriter& w, const FramePixels& pixels, size_t frame_index) const;

    // Shape check used by assemble/assemble_into.
    void check_shape(const FramePixels& pixels, size_t frame_index) const;

private:
    std::vector<PortSlice> slices_;
    std::unordered_map<uint16_t, size_t> by_index_;
    size_t frame_size_ = 0;
};

// Bytes of one port across every frame of a file, in frame order.
std::vector<std::vector<uint8_t>> port_stream(const RgbFile& file, uint16_t port_index);

} // namespace rgb0
