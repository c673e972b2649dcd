#include "format/errors.hpp"

namespace rgb0 {

namespace {

std::string shape_message(size_t frame_index, long port_index, size_t expected, size_t actual,
                          const std::string& what_counted) {
    std::string msg = "frame " + std::to_string(frame_index);
    if (port_index >= 0) msg += " port " + std::to_string(port_index);
    msg += " has " + std::to_string(actual) + " " + what_counted +
           "; expected " + std::to_string(expected);
    return msg;
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MalformedHeader:     return "MalformedHeader";
    case ErrorKind::TruncatedHeader:     return "TruncatedHeader";
    case ErrorKind::TruncatedPortTable:  return "TruncatedPortTable";
    case ErrorKind::TruncatedGammaTable: return "TruncatedGammaTable";
    case ErrorKind::ShapeMismatch:       return "ShapeMismatch";
    case ErrorKind::InvalidGammaTable:   return "InvalidGammaTable";
    case ErrorKind::UnknownPort:         return "UnknownPort";
    case ErrorKind::InconsistentLayout:  return "InconsistentLayout";
    case ErrorKind::InvalidParameter:    return "InvalidParameter";
    }
    return "Unknown";
}

UnknownPort::UnknownPort(uint16_t port_index)
    : Rgb0Error(ErrorKind::UnknownPort, "port " + std::to_string(port_index) + " not in port table"),
      port_index_(port_index) {}

ShapeMismatch::ShapeMismatch(size_t frame_index, long port_index, size_t expected, size_t actual,
                             const std::string& what_counted)
    : Rgb0Error(ErrorKind::ShapeMismatch,
                shape_message(frame_index, port_index, expected, actual, what_counted)),
      frame_index_(frame_index),
      port_index_(port_index),
      expected_(expected),
      actual_(actual) {}

} // namespace rgb0
