#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rgb0 {

enum class ErrorKind : uint8_t {
    MalformedHeader,
    TruncatedHeader,
    TruncatedPortTable,
    TruncatedGammaTable,
    ShapeMismatch,
    InvalidGammaTable,
    UnknownPort,
    InconsistentLayout,
    InvalidParameter,
};

const char* error_kind_name(ErrorKind kind);

// Base of every codec failure. Frame truncation on read is not an error.
class Rgb0Error : public std::runtime_error {
public:
    Rgb0Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
private:
    ErrorKind kind_;
};

class MalformedHeader : public Rgb0Error {
public:
    explicit MalformedHeader(const std::string& msg) : Rgb0Error(ErrorKind::MalformedHeader, msg) {}
};

class TruncatedHeader : public Rgb0Error {
public:
    explicit TruncatedHeader(const std::string& msg) : Rgb0Error(ErrorKind::TruncatedHeader, msg) {}
};

class TruncatedPortTable : public Rgb0Error {
public:
    explicit TruncatedPortTable(const std::string& msg) : Rgb0Error(ErrorKind::TruncatedPortTable, msg) {}
};

class TruncatedGammaTable : public Rgb0Error {
public:
    explicit TruncatedGammaTable(const std::string& msg) : Rgb0Error(ErrorKind::TruncatedGammaTable, msg) {}
};

class InvalidGammaTable : public Rgb0Error {
public:
    explicit InvalidGammaTable(const std::string& msg) : Rgb0Error(ErrorKind::InvalidGammaTable, msg) {}
};

class InconsistentLayout : public Rgb0Error {
public:
    explicit InconsistentLayout(const std::string& msg) : Rgb0Error(ErrorKind::InconsistentLayout, msg) {}
};

class InvalidParameter : public Rgb0Error {
public:
    explicit InvalidParameter(const std::string& msg) : Rgb0Error(ErrorKind::InvalidParameter, msg) {}
};

class UnknownPort : public Rgb0Error {
public:
    explicit UnknownPort(uint16_t port_index);
    uint16_t port_index() const { return port_index_; }
private:
    uint16_t port_index_;
};

// Frame (and optionally port) that does not match the expected shape.
// port_index < 0 means the frame itself has the wrong port count.
class ShapeMismatch : public Rgb0Error {
public:
    ShapeMismatch(size_t frame_index, long port_index, size_t expected, size_t actual,
                  const std::string& what_counted);
    size_t frame_index() const { return frame_index_; }
    long port_index() const { return port_index_; }
    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }
private:
    size_t frame_index_;
    long port_index_;
    size_t expected_;
    size_t actual_;
};

} // namespace rgb0
