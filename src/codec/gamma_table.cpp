#include "codec/gamma_table.hpp"

#include "format/errors.hpp"

#include <algorithm>

namespace rgb0 {

GammaTable decode_gamma_table(const uint8_t* data, size_t size) {
    if (size < kGammaBytes) {
        throw TruncatedGammaTable("gamma table: need " + std::to_string(kGammaBytes) +
                                  " bytes, got " + std::to_string(size));
    }
    ByteReader r(data, kGammaBytes);
    GammaTable lut{};
    for (auto& v : lut) v = r.read_u16_be();
    return lut;
}

GammaTable identity_gamma() {
    GammaTable lut{};
    for (size_t i = 0; i < lut.size(); ++i) lut[i] = static_cast<uint16_t>(i);
    return lut;
}

GammaTable make_gamma_table(const std::optional<std::vector<uint16_t>>& values) {
    if (!values) return identity_gamma();
    if (values->size() != kGammaEntries) {
        throw InvalidGammaTable("gamma table must contain exactly 256 entries, got " +
                                std::to_string(values->size()));
    }
    GammaTable lut{};
    std::copy(values->begin(), values->end(), lut.begin());
    return lut;
}

void write_gamma_table(ByteWriter& w, const GammaTable& lut) {
    for (uint16_t v : lut) w.write_u16_be(v);
}

} // namespace rgb0
