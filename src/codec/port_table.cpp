#include "codec/port_table.hpp"

#include "format/errors.hpp"

namespace rgb0 {

std::vector<PortDescriptor> decode_port_table(const uint8_t* data, size_t size, uint16_t port_count) {
    const size_t need = static_cast<size_t>(port_count) * kPortEntryBytes;
    if (size < need) {
        throw TruncatedPortTable("port table: need " + std::to_string(need) +
                                 " bytes for " + std::to_string(port_count) +
                                 " ports, got " + std::to_string(size));
    }

    ByteReader r(data, need);
    std::vector<PortDescriptor> ports;
    ports.reserve(port_count);
    for (uint16_t i = 0; i < port_count; ++i) {
        PortDescriptor p;
        p.index = r.read_u16_be();
        p.length = r.read_u16_be();
        r.skip(4);
        p.mode = r.read_u8();
        p.flags = r.read_u16_be();
        p.loop_byte = r.read_u8();
        p.loop_flag = (p.loop_byte & kLoopFlagMask) != 0;
        r.skip(1);
        ports.push_back(p);
    }
    return ports;
}

std::vector<PortDescriptor> make_uniform_ports(uint16_t port_count,
                                               uint16_t bytes_per_port,
                                               uint8_t loop_byte,
                                               uint8_t mode,
                                               uint16_t flags) {
    std::vector<PortDescriptor> ports(port_count);
    for (uint16_t i = 0; i < port_count; ++i) {
        PortDescriptor& p = ports[i];
        p.index = i;
        p.length = bytes_per_port;
        p.mode = mode;
        p.flags = flags;
        p.loop_byte = loop_byte;
        p.loop_flag = (loop_byte & kLoopFlagMask) != 0;
    }
    return ports;
}

void write_port_entry(ByteWriter& w, const PortDescriptor& port) {
    w.write_u16_be(port.index);
    w.write_u16_be(port.length);
    w.write_zeros(4);
    w.write_u8(port.mode);
    w.write_u16_be(port.flags);
    w.write_u8(port.loop_byte);
    w.write_u8(0x00);
}

void write_port_table(ByteWriter& w, const std::vector<PortDescriptor>& ports) {
    for (const auto& p : ports) write_port_entry(w, p);
}

} // namespace rgb0
