#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "format/rgb0_format.hpp"
#include "io/byte_stream.hpp"

namespace rgb0 {

// Decode port_count 13-byte records:
//   [0..1] index  [2..3] length  [4..7] reserved  [8] mode
//   [9..10] flags [11] loop byte  [12] reserved
// Throws TruncatedPortTable if size < port_count * 13.
std::vector<PortDescriptor> decode_port_table(const uint8_t* data, size_t size, uint16_t port_count);

// port_count descriptors with indices 0..port_count-1 and identical settings.
std::vector<PortDescriptor> make_uniform_ports(uint16_t port_count,
                                               uint16_t bytes_per_port,
                                               uint8_t loop_byte,
                                               uint8_t mode,
                                               uint16_t flags);

void write_port_entry(ByteWriter& w, const PortDescriptor& port);

// One record per port, in table order, reserved bytes zero.
void write_port_table(ByteWriter& w, const std::vector<PortDescriptor>& ports);

} // namespace rgb0
