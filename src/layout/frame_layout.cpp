#include "layout/frame_layout.hpp"

#include "format/errors.hpp"

namespace rgb0 {

std::vector<PortSlice> compute_port_offsets(const std::vector<PortDescriptor>& ports) {
    std::vector<PortSlice> slices;
    slices.reserve(ports.size());
    size_t offset = 0;
    for (const auto& p : ports) {
        slices.push_back({p.index, offset, p.length});
        offset += p.length;
    }
    return slices;
}

FrameLayout::FrameLayout(const std::vector<PortDescriptor>& ports)
    : slices_(compute_port_offsets(ports)) {
    by_index_.reserve(slices_.size());
    for (size_t i = 0; i < slices_.size(); ++i) {
        if (!by_index_.emplace(slices_[i].index, i).second) {
            throw InconsistentLayout("layout: port index " + std::to_string(slices_[i].index) +
                                     " appears more than once");
        }
        frame_size_ += slices_[i].length;
    }
}

const PortSlice& FrameLayout::slice_of(uint16_t port_index) const {
    auto it = by_index_.find(port_index);
    if (it == by_index_.end()) throw UnknownPort(port_index);
    return slices_[it->second];
}

std::vector<uint8_t> FrameLayout::extract(const Frame& frame, uint16_t port_index) const {
    const PortSlice& s = slice_of(port_index);
    if (frame.size() < frame_size_) {
        throw InvalidParameter("layout: frame has " + std::to_string(frame.size()) +
                               " bytes; layout needs " + std::to_string(frame_size_));
    }
    const auto first = frame.begin() + static_cast<std::ptrdiff_t>(s.offset);
    return std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(s.length));
}

void FrameLayout::check_shape(const FramePixels& pixels, size_t frame_index) const {
    if (pixels.size() != slices_.size()) {
        throw ShapeMismatch(frame_index, -1, slices_.size(), pixels.size(), "ports");
    }
    for (size_t i = 0; i < slices_.size(); ++i) {
        if (pixels[i].size() * 3 != slices_[i].length) {
            throw ShapeMismatch(frame_index, static_cast<long>(i), slices_[i].length / 3,
                                pixels[i].size(), "LEDs");
        }
    }
}

void FrameLayout::assemble_into(ByteWriter& w, const FramePixels& pixels, size_t frame_index) const {
    check_shape(pixels, frame_index);
    for (const auto& port : pixels) {
        for (const Rgb& led : port) {
            w.write_u8(led.r);
            w.write_u8(led.g);
            w.write_u8(led.b);
        }
    }
}

Frame FrameLayout::assemble(const FramePixels& pixels, size_t frame_index) const {
    ByteWriter w;
    w.reserve(frame_size_);
    assemble_into(w, pixels, frame_index);
    return w.take();
}

std::vector<std::vector<uint8_t>> port_stream(const RgbFile& file, uint16_t port_index) {
    const FrameLayout layout(file.header.ports);
    layout.slice_of(port_index);
    std::vector<std::vector<uint8_t>> out;
    out.reserve(file.frames.size());
    for (const auto& frame : file.frames) {
        out.push_back(layout.extract(frame, port_index));
    }
    return out;
}

} // namespace rgb0
