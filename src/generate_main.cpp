#include "cli/cli_parser.hpp"
#include "codec/writer.hpp"
#include "format/errors.hpp"
#include "io/capture_io.hpp"

#include <iostream>
#include <limits>
#include <sstream>

namespace {

const char* kUsage =
    "Usage: rgb0_generate --out <dir> [--run N] [--frames N] [--leds N]\n"
    "                     [--color r,g,b] [--pattern solid|chase]\n"
    "                     [--loop-byte B] [--mode M] [--flags F]\n";

rgb0::Rgb parse_color(const std::string& s) {
    std::istringstream is(s);
    std::string part;
    int c[3] = {0, 0, 0};
    int n = 0;
    while (std::getline(is, part, ',')) {
        if (n >= 3) throw std::runtime_error("--color expects r,g,b");
        size_t used = 0;
        int v = 0;
        try {
            v = std::stoi(part, &used, 0);
        } catch (const std::logic_error&) {
            throw std::runtime_error("--color expects r,g,b, got '" + s + "'");
        }
        if (used != part.size() || v < 0 || v > 255) {
            throw std::runtime_error("--color components must be 0..255, got '" + s + "'");
        }
        c[n++] = v;
    }
    if (n != 3) throw std::runtime_error("--color expects r,g,b");
    return rgb0::Rgb{static_cast<uint8_t>(c[0]), static_cast<uint8_t>(c[1]), static_cast<uint8_t>(c[2])};
}

// solid: every LED lit with color.
// chase: one LED per port lit, advancing one position per frame.
std::vector<rgb0::FramePixels> build_frames(const std::string& pattern,
                                            size_t frame_count,
                                            size_t port_count,
                                            size_t leds_per_port,
                                            const rgb0::Rgb& color) {
    std::vector<rgb0::FramePixels> frames;
    frames.reserve(frame_count);
    for (size_t f = 0; f < frame_count; ++f) {
        rgb0::FramePixels frame(port_count);
        for (auto& port : frame) {
            if (pattern == "solid") {
                port.assign(leds_per_port, color);
            } else {
                port.assign(leds_per_port, rgb0::Rgb{});
                port[f % leds_per_port] = color;
            }
        }
        frames.push_back(std::move(frame));
    }
    return frames;
}

} // namespace

int main(int argc, char** argv) {
    try {
        rgb0::CliParser cli;
        cli.parse(argc, argv);
        const std::string out = cli.get("out");
        const std::string pattern = cli.get("pattern", "solid");
        if (out.empty() || (pattern != "solid" && pattern != "chase")) {
            std::cout << kUsage;
            return 1;
        }

        rgb0::WriterConfig cfg;
        int run = 0;
        size_t frame_count = 0;
        rgb0::Rgb color{255, 255, 255};
        try {
            run = static_cast<int>(cli.get_uint("run", 1, std::numeric_limits<int>::max()));
            frame_count = cli.get_uint("frames", 30, std::numeric_limits<uint16_t>::max());
            cfg.leds_per_port = static_cast<uint16_t>(cli.get_uint("leds", rgb0::kDefaultLedsPerPort, 21845));
            cfg.loop_byte = static_cast<uint8_t>(cli.get_uint("loop-byte", rgb0::kDefaultLoopByte, 0xFF));
            cfg.mode = static_cast<uint8_t>(cli.get_uint("mode", rgb0::kModeSpiTtl, 0xFF));
            cfg.flags = static_cast<uint16_t>(cli.get_uint("flags", rgb0::kDefaultFlags, 0xFFFF));
            if (cli.has("color")) color = parse_color(cli.get("color"));
        } catch (const std::runtime_error& e) {
            std::cout << e.what() << "\n" << kUsage;
            return 1;
        }
        if (frame_count == 0 || cfg.leds_per_port == 0) {
            std::cout << kUsage;
            return 1;
        }

        const auto frames = build_frames(pattern, frame_count, cfg.port_count, cfg.leds_per_port, color);
        const auto bytes = rgb0::encode_rgb0(frames, cfg);
        const std::string path = rgb0::save_capture(out, run, bytes);
        std::cout << "Wrote: " << path << " (" << frame_count << " frames, " << bytes.size() << " bytes)\n";
        return 0;
    } catch (const rgb0::Rgb0Error& e) {
        std::cerr << "[ERROR] " << rgb0::error_kind_name(e.kind()) << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
