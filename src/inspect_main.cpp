#include "cli/cli_parser.hpp"
#include "format/errors.hpp"
#include "io/capture_io.hpp"
#include "io/summary.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

static void usage() {
    std::cerr << "Usage: rgb0_inspect [--max-frames N] <capture.rgb> [more.rgb ...]\n";
}

int main(int argc, char** argv) {
    namespace fs = std::filesystem;
    rgb0::CliParser cli;
    cli.parse(argc, argv);

    rgb0::ReadOptions opt;
    try {
        if (cli.has("max-frames")) {
            opt.max_frames = cli.get_uint("max-frames", 0, std::numeric_limits<unsigned long>::max());
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        return 1;
    }
    const auto& paths = cli.positional();
    if (paths.empty()) {
        usage();
        return 1;
    }

    int rc = 0;
    for (size_t i = 0; i < paths.size(); ++i) {
        const fs::path p(paths[i]);
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) {
            std::cout << p.string() << " missing or not a file, skipping\n";
        } else {
            try {
                const rgb0::RgbFile file = rgb0::read_rgb0_file(p.string(), opt);
                rgb0::print_summary(std::cout, p.filename().string(), file);
            } catch (const rgb0::Rgb0Error& e) {
                std::cerr << "[ERROR] " << p.string() << ": " << rgb0::error_kind_name(e.kind())
                          << ": " << e.what() << "\n";
                rc = 2;
            } catch (const std::exception& e) {
                std::cerr << "[ERROR] " << p.string() << ": " << e.what() << "\n";
                rc = 2;
            }
        }
        if (i + 1 != paths.size()) std::cout << "\n";
    }
    return rc;
}
