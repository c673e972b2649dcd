#include "test.h"

#include "codec/writer.hpp"
#include "format/errors.hpp"
#include "io/capture_io.hpp"

#include <filesystem>
#include <sstream>
#include <streambuf>
#include <stdexcept>

using namespace rgb0;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / ("rgb0_test_" + name);
    fs::remove_all(dir);
    return dir;
}

// Readable but not seekable, like a pipe.
class UnseekableBuf : public std::streambuf {
public:
    explicit UnseekableBuf(std::string& data) { setg(&data[0], &data[0], &data[0] + data.size()); }
};

} // namespace

TEST_CASE("capture file names embed the run number") {
    CHECK(capture_file_name(1) == "Sc-01-01.rgb");
    CHECK(capture_file_name(7) == "Sc-07-01.rgb");
    CHECK(capture_file_name(42) == "Sc-42-01.rgb");
    CHECK(capture_file_name(123) == "Sc-123-01.rgb");
    CHECK_THROWS_AS(capture_file_name(-1), InvalidParameter);
}

TEST_CASE("save_capture then read_rgb0_file") {
    const fs::path dir = scratch_dir("save") / "nested";
    WriterConfig cfg;
    cfg.leds_per_port = 5;
    const auto frames = make_frames(4, 16, 5);
    const auto bytes = encode_rgb0(frames, cfg);

    const std::string path = save_capture(dir.string(), 3, bytes);
    CHECK(fs::path(path).filename().string() == "Sc-03-01.rgb");
    CHECK(fs::is_regular_file(path));
    CHECK(read_all(path) == bytes);

    const RgbFile file = read_rgb0_file(path);
    REQUIRE(file.frames.size() == 4);
    CHECK(file.frames[2] == frame_bytes(frames[2]));

    ReadOptions opt;
    opt.max_frames = 1;
    CHECK(read_rgb0_file(path, opt).frames.size() == 1);

    fs::remove_all(dir.parent_path());
}

TEST_CASE("read_rgb0_file on a truncated file") {
    const fs::path dir = scratch_dir("truncated");
    fs::create_directories(dir);
    WriterConfig cfg;
    cfg.leds_per_port = 2;
    auto bytes = encode_rgb0(make_frames(3, 16, 2), cfg);
    bytes.resize(bytes.size() - 1);
    const std::string path = (dir / "cut.rgb").string();
    write_all(path, bytes);
    CHECK(read_rgb0_file(path).frames.size() == 2);

    write_all(path, std::vector<uint8_t>(bytes.begin(), bytes.begin() + 10));
    CHECK_THROWS_AS(read_rgb0_file(path), TruncatedHeader);

    fs::remove_all(dir);
}

TEST_CASE("missing files") {
    const fs::path dir = scratch_dir("missing");
    CHECK_THROWS_AS(read_rgb0_file((dir / "none.rgb").string()), std::runtime_error);
    CHECK_THROWS_AS(read_all((dir / "none.rgb").string()), std::runtime_error);
}

TEST_CASE("read_all from streams") {
    std::string data = "RGB0 payload";

    SUBCASE("seekable stream") {
        std::istringstream is(data);
        const auto bytes = read_all(is, "mem");
        CHECK(std::string(bytes.begin(), bytes.end()) == data);
    }
    SUBCASE("stream without a known size") {
        UnseekableBuf buf(data);
        std::istream is(&buf);
        CHECK_THROWS_AS(read_all(is, "pipe"), std::runtime_error);
    }
}
