#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "codec/reader.hpp"
#include "format/rgb0_format.hpp"

namespace rgb0 {

std::vector<uint8_t> read_all(const std::string& path);
// Whole seekable stream; name is used in error messages.
std::vector<uint8_t> read_all(std::istream& is, const std::string& name);
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

// Stream a capture file from disk (the file is closed on every exit path).
RgbFile read_rgb0_file(const std::string& path, const ReadOptions& opt = {});

// "Sc-<run:02d>-01.rgb", the name the SD card runner plays.
std::string capture_file_name(int run_number);

// Create dir if needed, write bytes as capture_file_name(run_number), return the path.
std::string save_capture(const std::string& dir, int run_number, const std::vector<uint8_t>& bytes);

} // namespace rgb0
