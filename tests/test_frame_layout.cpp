#include "test.h"

#include "format/errors.hpp"
#include "layout/frame_layout.hpp"

using namespace rgb0;

TEST_CASE("two ports of 1000 LEDs") {
    const FrameLayout layout({port(0, 3000), port(1, 3000)});
    CHECK(layout.frame_size() == 6000);
    CHECK(layout.port_count() == 2);
    CHECK(layout.offset_of(0) == 0);
    CHECK(layout.offset_of(1) == 3000);

    const Frame frame = counting_bytes(6000, 7);
    const auto p0 = layout.extract(frame, 0);
    CHECK(p0 == std::vector<uint8_t>(frame.begin(), frame.begin() + 3000));
    const auto p1 = layout.extract(frame, 1);
    CHECK(p1 == std::vector<uint8_t>(frame.begin() + 3000, frame.end()));
}

TEST_CASE("offsets follow table order, not index order") {
    const std::vector<PortDescriptor> ports = {port(7, 6), port(2, 9), port(40, 3)};
    const auto slices = compute_port_offsets(ports);
    REQUIRE(slices.size() == 3);
    CHECK(slices[0].index == 7);
    CHECK(slices[0].offset == 0);
    CHECK(slices[1].offset == 6);
    CHECK(slices[2].offset == 15);
    CHECK(slices[2].length == 3);

    const FrameLayout layout(ports);
    CHECK(layout.frame_size() == 18);
    CHECK(layout.offset_of(40) == 15);
    CHECK(layout.slice_of(2).length == 9);
}

TEST_CASE("a new table gives new offsets") {
    std::vector<PortDescriptor> ports = {port(0, 6), port(1, 3)};
    CHECK(FrameLayout(ports).offset_of(1) == 6);
    ports[0].length = 12;
    CHECK(FrameLayout(ports).offset_of(1) == 12);
    std::swap(ports[0], ports[1]);
    CHECK(FrameLayout(ports).offset_of(1) == 0);
    CHECK(FrameLayout(ports).offset_of(0) == 3);
}

TEST_CASE("unknown port") {
    const FrameLayout layout({port(0, 3), port(1, 3)});
    CHECK_THROWS_AS(layout.offset_of(2), UnknownPort);
    try {
        layout.extract(Frame(6, 0), 9);
        FAIL("expected UnknownPort");
    } catch (const UnknownPort& e) {
        CHECK(e.port_index() == 9);
        CHECK(e.kind() == ErrorKind::UnknownPort);
    }
}

TEST_CASE("duplicate port index") {
    CHECK_THROWS_AS(FrameLayout({port(3, 3), port(3, 6)}), InconsistentLayout);
}

TEST_CASE("extract from a short frame") {
    const FrameLayout layout({port(0, 3), port(1, 3)});
    CHECK_THROWS_AS(layout.extract(Frame(5, 0), 0), InvalidParameter);
}

TEST_CASE("assemble concatenates triplets in table order") {
    const FrameLayout layout({port(0, 6), port(1, 3)});
    FramePixels pixels(2);
    pixels[0] = {Rgb{1, 2, 3}, Rgb{4, 5, 6}};
    pixels[1] = {Rgb{7, 8, 9}};
    const Frame frame = layout.assemble(pixels);
    CHECK(frame == std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9});
    CHECK(frame.size() == layout.frame_size());
    CHECK(layout.extract(frame, 1) == std::vector<uint8_t>{7, 8, 9});
}

TEST_CASE("assemble checks the shape") {
    const FrameLayout layout({port(0, 6), port(1, 6)});

    SUBCASE("missing port") {
        FramePixels pixels(1, PortPixels(2));
        try {
            layout.assemble(pixels, 4);
            FAIL("expected ShapeMismatch");
        } catch (const ShapeMismatch& e) {
            CHECK(e.frame_index() == 4);
            CHECK(e.port_index() == -1);
            CHECK(e.expected() == 2);
            CHECK(e.actual() == 1);
        }
    }

    SUBCASE("short port") {
        FramePixels pixels = {PortPixels(2), PortPixels(1)};
        try {
            layout.assemble(pixels, 0);
            FAIL("expected ShapeMismatch");
        } catch (const ShapeMismatch& e) {
            CHECK(e.port_index() == 1);
            CHECK(e.expected() == 2);
            CHECK(e.actual() == 1);
        }
    }
}

TEST_CASE("port_stream collects one port across frames") {
    RgbFile file;
    file.header.ports = {port(5, 2), port(6, 3)};
    file.header.frame_size = 5;
    file.frames = {Frame{1, 2, 3, 4, 5}, Frame{6, 7, 8, 9, 10}};

    const auto stream = port_stream(file, 6);
    REQUIRE(stream.size() == 2);
    CHECK(stream[0] == std::vector<uint8_t>{3, 4, 5});
    CHECK(stream[1] == std::vector<uint8_t>{8, 9, 10});

    file.frames.clear();
    CHECK_THROWS_AS(port_stream(file, 1), UnknownPort);
}
