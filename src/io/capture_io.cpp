#include "io/capture_io.hpp"

#include "format/errors.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace rgb0 {

std::vector<uint8_t> read_all(std::istream& is, const std::string& name) {
    is.seekg(0, std::ios::end);
    const std::streamsize n = is.tellg();
    if (n < 0) throw std::runtime_error("Cannot open file: " + name + " (size unknown)");
    is.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    is.read(reinterpret_cast<char*>(buf.data()), n);
    if (is.gcount() != n) throw std::runtime_error("Short read: " + name);
    return buf;
}

std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    return read_all(ifs, path);
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

RgbFile read_rgb0_file(const std::string& path, const ReadOptions& opt) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    return read_rgb0(ifs, opt);
}

std::string capture_file_name(int run_number) {
    if (run_number < 0) {
        throw InvalidParameter("run number must be >= 0, got " + std::to_string(run_number));
    }
    char name[32];
    std::snprintf(name, sizeof(name), "Sc-%02d-01.rgb", run_number);
    return name;
}

std::string save_capture(const std::string& dir, int run_number, const std::vector<uint8_t>& bytes) {
    namespace fs = std::filesystem;
    const fs::path out = fs::path(dir) / capture_file_name(run_number);
    if (!out.parent_path().empty()) fs::create_directories(out.parent_path());
    write_all(out.string(), bytes);
    return out.string();
}

} // namespace rgb0
