#pragma once

#include <iosfwd>
#include <string>

#include "format/rgb0_format.hpp"

namespace rgb0 {

// Layout summary of a decoded capture:
//   <name>: frame_size=<n> bytes, frames=<k> (header claims <c>)
//     gamma sample: [g0, g1, g2, g3]
//       Port <i>: len=<l>, mode=0x<mm>, flags=0x<ffff>, loop=<bool>, offset=<o>
//     first frame preview (16 bytes): <hex>
void print_summary(std::ostream& os, const std::string& name, const RgbFile& file);

} // namespace rgb0
